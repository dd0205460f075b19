#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace quarry {

/// One step of a key path: a kind plus either a numeric id or a string name.
struct PathElement {
    std::string kind;
    int64_t id = 0;
    std::string name;

    bool hasName() const { return !name.empty(); }

    bool operator==(const PathElement& other) const {
        return kind == other.kind && id == other.id && name == other.name;
    }
    bool operator!=(const PathElement& other) const { return !(*this == other); }
};

/**
 * Hierarchical record identifier. The last path element names the record,
 * the preceding ones its ancestors.
 *
 * Text form: elements joined by '/', each "Kind:i<id>" or "Kind:n<name>".
 * '%', '/' and ':' inside kinds and names are percent-escaped.
 */
class Key {
public:
    Key() = default;

    static Key fromId(const std::string& kind, int64_t id);
    static Key fromName(const std::string& kind, const std::string& name);
    static std::optional<Key> fromString(const std::string& encoded);

    Key child(const std::string& kind, int64_t id) const;
    Key child(const std::string& kind, const std::string& name) const;

    bool isValid() const { return !path_.empty(); }
    const std::vector<PathElement>& path() const { return path_; }

    const std::string& kind() const;
    int64_t id() const;
    const std::string& name() const;

    // Empty for root keys
    std::optional<Key> parent() const;
    Key root() const;
    // True when `ancestor` equals this key or is a proper prefix of its path
    bool hasAncestor(const Key& ancestor) const;

    std::string toString() const;
    std::string debugString() const;

    bool operator==(const Key& other) const { return path_ == other.path_; }
    bool operator!=(const Key& other) const { return !(*this == other); }
    bool operator<(const Key& other) const;

private:
    std::vector<PathElement> path_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);

} // namespace quarry
