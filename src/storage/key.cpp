#include "storage/key.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace quarry {

namespace {

const std::string kEmpty;

std::string escape(const std::string& raw) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '%' || c == '/' || c == ':') {
            auto b = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(hex[b >> 4]);
            out.push_back(hex[b & 0x0F]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<std::string> unescape(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            out.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size()) return std::nullopt;
        int hi = hexDigit(encoded[i + 1]);
        int lo = hexDigit(encoded[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::optional<PathElement> parseElement(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    auto kind = unescape(text.substr(0, colon));
    if (!kind) return std::nullopt;

    PathElement elem;
    elem.kind = *kind;
    char tag = text[colon + 1];
    std::string rest = text.substr(colon + 2);
    if (tag == 'i') {
        int64_t id = 0;
        auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), id);
        if (ec != std::errc() || ptr != rest.data() + rest.size() || rest.empty()) {
            return std::nullopt;
        }
        elem.id = id;
    } else if (tag == 'n') {
        auto name = unescape(rest);
        if (!name || name->empty()) return std::nullopt;
        elem.name = *name;
    } else {
        return std::nullopt;
    }
    return elem;
}

// Numeric ids order before names, as in the native store
int compareElement(const PathElement& a, const PathElement& b) {
    if (int c = a.kind.compare(b.kind)) return c;
    if (a.hasName() != b.hasName()) return a.hasName() ? 1 : -1;
    if (a.hasName()) return a.name.compare(b.name);
    if (a.id == b.id) return 0;
    return a.id < b.id ? -1 : 1;
}

} // namespace

Key Key::fromId(const std::string& kind, int64_t id) {
    if (kind.empty()) {
        throw std::invalid_argument("Key kind must not be empty");
    }
    Key k;
    k.path_.push_back(PathElement{kind, id, {}});
    return k;
}

Key Key::fromName(const std::string& kind, const std::string& name) {
    if (kind.empty() || name.empty()) {
        throw std::invalid_argument("Key kind and name must not be empty");
    }
    Key k;
    k.path_.push_back(PathElement{kind, 0, name});
    return k;
}

std::optional<Key> Key::fromString(const std::string& encoded) {
    if (encoded.empty()) return std::nullopt;
    Key k;
    size_t start = 0;
    while (start <= encoded.size()) {
        auto slash = encoded.find('/', start);
        std::string part = encoded.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        auto elem = parseElement(part);
        if (!elem) return std::nullopt;
        k.path_.push_back(std::move(*elem));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return k;
}

Key Key::child(const std::string& kind, int64_t id) const {
    Key k = *this;
    k.path_.push_back(Key::fromId(kind, id).path_.front());
    return k;
}

Key Key::child(const std::string& kind, const std::string& name) const {
    Key k = *this;
    k.path_.push_back(Key::fromName(kind, name).path_.front());
    return k;
}

const std::string& Key::kind() const {
    return path_.empty() ? kEmpty : path_.back().kind;
}

int64_t Key::id() const {
    return path_.empty() ? 0 : path_.back().id;
}

const std::string& Key::name() const {
    return path_.empty() ? kEmpty : path_.back().name;
}

std::optional<Key> Key::parent() const {
    if (path_.size() < 2) return std::nullopt;
    Key k;
    k.path_.assign(path_.begin(), path_.end() - 1);
    return k;
}

Key Key::root() const {
    Key k;
    if (!path_.empty()) k.path_.push_back(path_.front());
    return k;
}

bool Key::hasAncestor(const Key& ancestor) const {
    if (ancestor.path_.empty() || ancestor.path_.size() > path_.size()) return false;
    for (size_t i = 0; i < ancestor.path_.size(); ++i) {
        if (path_[i] != ancestor.path_[i]) return false;
    }
    return true;
}

std::string Key::toString() const {
    std::string out;
    for (size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) out.push_back('/');
        const auto& e = path_[i];
        out += escape(e.kind);
        out.push_back(':');
        if (e.hasName()) {
            out.push_back('n');
            out += escape(e.name);
        } else {
            out.push_back('i');
            out += std::to_string(e.id);
        }
    }
    return out;
}

std::string Key::debugString() const {
    if (path_.empty()) return "Key()";
    std::string out = "Key(";
    for (size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) out += ", ";
        const auto& e = path_[i];
        out += e.kind;
        out += e.hasName() ? "(\"" + e.name + "\")" : "(" + std::to_string(e.id) + ")";
    }
    out += ")";
    return out;
}

bool Key::operator<(const Key& other) const {
    size_t n = std::min(path_.size(), other.path_.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compareElement(path_[i], other.path_[i]);
        if (c != 0) return c < 0;
    }
    return path_.size() < other.path_.size();
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    return os << key.debugString();
}

} // namespace quarry
