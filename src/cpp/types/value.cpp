#include <syncdl/types/value.h>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace syncdl {

    Object::Object() = default;

    Object::Object(std::initializer_list<entry_type> entries) {
        _entries.reserve(entries.size());
        for (const auto &[key, value] : entries) { insert_or_assign(key, value); }
    }

    Object::Object(const Object &other) = default;

    Object::Object(Object &&other) noexcept = default;

    Object &Object::operator=(const Object &other) = default;

    Object &Object::operator=(Object &&other) noexcept = default;

    Object::~Object() = default;

    std::size_t Object::size() const noexcept { return _entries.size(); }

    bool Object::empty() const noexcept { return _entries.empty(); }

    bool Object::contains(std::string_view key) const { return find(key) != nullptr; }

    const Value *Object::find(std::string_view key) const {
        auto it = std::find_if(_entries.begin(), _entries.end(), [key](const entry_type &e) { return e.first == key; });
        return it == _entries.end() ? nullptr : &it->second;
    }

    Value *Object::find(std::string_view key) {
        return const_cast<Value *>(static_cast<const Object *>(this)->find(key));
    }

    const Value &Object::at(std::string_view key) const {
        if (auto *value = find(key); value != nullptr) { return *value; }
        throw std::out_of_range(fmt::format("Object has no key '{}'", key));
    }

    Value &Object::insert_or_assign(std::string key, Value value) {
        if (auto *existing = find(key); existing != nullptr) {
            *existing = std::move(value);
            return *existing;
        }
        return _entries.emplace_back(std::move(key), std::move(value)).second;
    }

    bool Object::erase(std::string_view key) {
        auto it = std::find_if(_entries.begin(), _entries.end(), [key](const entry_type &e) { return e.first == key; });
        if (it == _entries.end()) { return false; }
        _entries.erase(it);
        return true;
    }

    std::vector<std::string> Object::keys() const {
        std::vector<std::string> result;
        result.reserve(_entries.size());
        for (const auto &[key, _] : _entries) { result.push_back(key); }
        return result;
    }

    Object::iterator Object::begin() noexcept { return _entries.begin(); }

    Object::iterator Object::end() noexcept { return _entries.end(); }

    Object::const_iterator Object::begin() const noexcept { return _entries.begin(); }

    Object::const_iterator Object::end() const noexcept { return _entries.end(); }

    bool operator==(const Object &lhs, const Object &rhs) { return lhs._entries == rhs._entries; }

    double Value::as_float() const {
        if (is_int()) { return static_cast<double>(as_int()); }
        return std::get<double>(_storage);
    }

    const Value *Value::get(std::string_view key) const {
        if (!is_object()) { return nullptr; }
        return as_object().find(key);
    }

    namespace {
        void append_escaped(std::string &out, std::string_view s) {
            out.push_back('"');
            for (char c : s) {
                switch (c) {
                    case '"': out += "\\\"";
                        break;
                    case '\\': out += "\\\\";
                        break;
                    case '\n': out += "\\n";
                        break;
                    case '\r': out += "\\r";
                        break;
                    case '\t': out += "\\t";
                        break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) {
                            out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                        } else {
                            out.push_back(c);
                        }
                }
            }
            out.push_back('"');
        }

        void append_value(std::string &out, const Value &value) {
            switch (value.kind()) {
                case Value::Kind::NULL_VALUE: out += "null";
                    break;
                case Value::Kind::BOOLEAN: out += value.as_bool() ? "true" : "false";
                    break;
                case Value::Kind::INT: out += fmt::format("{}", value.as_int());
                    break;
                case Value::Kind::FLOAT: out += fmt::format("{}", value.as_float());
                    break;
                case Value::Kind::STRING: append_escaped(out, value.as_string());
                    break;
                case Value::Kind::LIST: {
                    out.push_back('[');
                    bool first = true;
                    for (const auto &item : value.as_list()) {
                        if (!first) { out.push_back(','); }
                        first = false;
                        append_value(out, item);
                    }
                    out.push_back(']');
                    break;
                }
                case Value::Kind::OBJECT: {
                    out.push_back('{');
                    bool first = true;
                    for (const auto &[key, item] : value.as_object()) {
                        if (!first) { out.push_back(','); }
                        first = false;
                        append_escaped(out, key);
                        out.push_back(':');
                        append_value(out, item);
                    }
                    out.push_back('}');
                    break;
                }
            }
        }
    } // namespace

    std::string Value::to_string() const {
        std::string out;
        append_value(out, *this);
        return out;
    }

    bool operator==(const Value &lhs, const Value &rhs) { return lhs._storage == rhs._storage; }

    std::string_view to_string(Value::Kind kind) {
        switch (kind) {
            case Value::Kind::NULL_VALUE: return "null";
            case Value::Kind::BOOLEAN: return "Boolean";
            case Value::Kind::INT: return "Int";
            case Value::Kind::FLOAT: return "Float";
            case Value::Kind::STRING: return "String";
            case Value::Kind::LIST: return "List";
            case Value::Kind::OBJECT: return "Object";
        }
        return "unknown";
    }

} // namespace syncdl
