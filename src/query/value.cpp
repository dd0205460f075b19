#include "query/value.h"

#include <sstream>

namespace quarry {
namespace query {

std::string Value::toString() const {
    struct Printer {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream os;
            os << d;
            return os.str();
        }
        std::string operator()(char c) const { return std::string("'") + c + "'"; }
        std::string operator()(const std::string& s) const { return "\"" + s + "\""; }
        std::string operator()(const Decimal& d) const { return d.digits; }
        std::string operator()(const Bytes& b) const { return "bytes[" + std::to_string(b.size()) + "]"; }
        std::string operator()(const EnumValue& e) const { return e.type + "." + e.name; }
        std::string operator()(const Key& k) const { return k.debugString(); }
        std::string operator()(const ValueList& l) const {
            std::string out = "[";
            for (size_t i = 0; i < l.size(); ++i) {
                if (i > 0) out += ", ";
                out += l[i].toString();
            }
            return out + "]";
        }
    };
    return std::visit(Printer{}, data);
}

} // namespace query
} // namespace quarry
