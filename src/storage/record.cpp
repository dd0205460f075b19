#include "storage/record.h"

#include <sstream>
#include <stdexcept>

namespace quarry {

namespace {

// Position of each alternative in the cross-type order
int typeRank(const PropertyValue& v) {
    switch (v.index()) {
        case 0: return 0;          // null
        case 2: case 3: return 1;  // numbers
        case 1: return 2;          // bool
        case 5: return 3;          // blob
        case 4: return 4;          // string
        case 6: return 5;          // key
    }
    return 6;
}

double asDouble(const PropertyValue& v) {
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    return std::get<double>(v);
}

template<typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> fromHex(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw std::invalid_argument("Odd-length hex blob");
    }
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(text.substr(i, 2), nullptr, 16)));
    }
    return out;
}

} // namespace

int compareProperty(const PropertyValue& a, const PropertyValue& b) {
    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (ra) {
        case 0:
            return 0;
        case 1:
            if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
                return threeWay(std::get<int64_t>(a), std::get<int64_t>(b));
            }
            return threeWay(asDouble(a), asDouble(b));
        case 2:
            return threeWay(std::get<bool>(a), std::get<bool>(b));
        case 3:
            return threeWay(std::get<Blob>(a).bytes, std::get<Blob>(b).bytes);
        case 4:
            return threeWay(std::get<std::string>(a), std::get<std::string>(b));
        case 5: {
            const auto& ka = std::get<Key>(a);
            const auto& kb = std::get<Key>(b);
            if (ka < kb) return -1;
            if (kb < ka) return 1;
            return 0;
        }
    }
    return 0;
}

bool propertyEquals(const PropertyValue& a, const PropertyValue& b) {
    return compareProperty(a, b) == 0;
}

std::string propertyToString(const PropertyValue& v) {
    struct Printer {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream os;
            os << d;
            return os.str();
        }
        std::string operator()(const std::string& s) const { return "\"" + s + "\""; }
        std::string operator()(const Blob& b) const { return "blob:" + toHex(b.bytes); }
        std::string operator()(const Key& k) const { return k.debugString(); }
    };
    return std::visit(Printer{}, v);
}

nlohmann::json propertyToJson(const PropertyValue& v) {
    struct Encoder {
        nlohmann::json operator()(std::monostate) const { return nullptr; }
        nlohmann::json operator()(bool b) const { return b; }
        nlohmann::json operator()(int64_t i) const { return i; }
        nlohmann::json operator()(double d) const { return d; }
        nlohmann::json operator()(const std::string& s) const { return s; }
        nlohmann::json operator()(const Blob& b) const { return {{"$blob", toHex(b.bytes)}}; }
        nlohmann::json operator()(const Key& k) const { return {{"$key", k.toString()}}; }
    };
    return std::visit(Encoder{}, v);
}

PropertyValue propertyFromJson(const nlohmann::json& j) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_object()) {
        if (j.contains("$blob")) {
            return Blob{fromHex(j.at("$blob").get<std::string>())};
        }
        if (j.contains("$key")) {
            auto key = Key::fromString(j.at("$key").get<std::string>());
            if (!key) {
                throw std::invalid_argument("Malformed key property: " + j.at("$key").get<std::string>());
            }
            return *key;
        }
    }
    throw std::invalid_argument("Unsupported property encoding: " + j.dump());
}

std::optional<PropertyValue> Record::get(const std::string& property) const {
    auto it = properties.find(property);
    if (it == properties.end()) return std::nullopt;
    return it->second;
}

nlohmann::json Record::toJson() const {
    nlohmann::json props = nlohmann::json::object();
    for (const auto& [name, value] : properties) {
        props[name] = propertyToJson(value);
    }
    return {{"key", key.toString()}, {"properties", props}};
}

Record Record::fromJson(const nlohmann::json& j) {
    Record r;
    auto key = Key::fromString(j.at("key").get<std::string>());
    if (!key) {
        throw std::invalid_argument("Malformed record key: " + j.at("key").get<std::string>());
    }
    r.key = std::move(*key);
    if (j.contains("properties")) {
        for (auto it = j.at("properties").begin(); it != j.at("properties").end(); ++it) {
            r.properties.emplace(it.key(), propertyFromJson(it.value()));
        }
    }
    return r;
}

} // namespace quarry
