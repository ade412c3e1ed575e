// ascii.cpp - implementation of the ASCII value writer

#include "wirepack/ascii.hpp"

#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace wirepack {

namespace {

// =============================================================================
// ascii_writer_t
// =============================================================================

class ascii_writer_t {
public:
    ascii_writer_t(std::ostream& stream, int indent)
        : os(stream), indent_size(indent) {}

    void write(const value_t& value) {
        write_value(value);
        os << "\n";
    }

private:
    std::ostream& os;
    int indent_size;
    int indent_level = 0;
    std::unordered_set<const void*> open_nodes;

    void write_indent() {
        for (int i = 0; i < indent_level * indent_size; ++i) {
            os << ' ';
        }
    }

    // Writes the value starting at the current column, without a newline
    void write_value(const value_t& value) {
        if (!value.is_composite()) {
            write_atom(value);
            return;
        }
        if (open_nodes.count(value.identity()) != 0) {
            os << "<cycle>";
            return;
        }
        open_nodes.insert(value.identity());
        if (value.is_sequence()) {
            write_sequence(*value.as_sequence());
        } else {
            write_mapping(*value.as_mapping());
        }
        open_nodes.erase(value.identity());
    }

    void write_sequence(const sequence_t& items) {
        if (all_atoms(items)) {
            os << "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) os << ", ";
                write_atom(items[i]);
            }
            os << "]";
            return;
        }
        os << "[\n";
        indent_level++;
        for (const auto& item : items) {
            write_indent();
            write_value(item);
            os << "\n";
        }
        indent_level--;
        write_indent();
        os << "]";
    }

    void write_mapping(const mapping_t& entries) {
        if (entries.empty()) {
            os << "{}";
            return;
        }
        os << "{\n";
        indent_level++;
        for (const auto& [key, item] : entries) {
            write_indent();
            auto inline_value = !item.is_composite() ||
                (item.is_sequence() && all_atoms(*item.as_sequence()));
            os << escape(key) << (inline_value ? " = " : " ");
            write_value(item);
            os << "\n";
        }
        indent_level--;
        write_indent();
        os << "}";
    }

    void write_atom(const value_t& value) {
        switch (value.kind()) {
            case kind_t::null:    os << "null"; break;
            case kind_t::absent:  os << "absent"; break;
            case kind_t::boolean: os << (value.as_bool() ? "true" : "false"); break;
            case kind_t::int64:   os << value.as_int64(); break;
            case kind_t::uint64:  os << value.as_uint64(); break;
            case kind_t::float64: os << format_double(value.as_double()); break;
            case kind_t::string:  os << "\"" << escape(value.as_string()) << "\""; break;
            case kind_t::binary:  os << "<bin " << value.as_binary().size() << " bytes>"; break;
            case kind_t::sequence:
            case kind_t::mapping:
                write_value(value);
                break;
        }
    }

    static auto all_atoms(const sequence_t& items) -> bool {
        for (const auto& item : items) {
            if (item.is_composite()) return false;
        }
        return true;
    }

    static auto format_double(double value) -> std::string {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        auto s = oss.str();
        if (s.find_first_of(".en") == std::string::npos) {
            s += ".0";
        }
        return s;
    }

    static auto escape(const std::string& s) -> std::string {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '\\': result += "\\\\"; break;
                case '"':  result += "\\\""; break;
                case '\n': result += "\\n"; break;
                case '\t': result += "\\t"; break;
                case '\r': result += "\\r"; break;
                default:   result += c; break;
            }
        }
        return result;
    }
};

} // namespace

void write_ascii(std::ostream& os, const value_t& value, int indent) {
    auto writer = ascii_writer_t(os, indent);
    writer.write(value);
}

auto to_ascii(const value_t& value, int indent) -> std::string {
    std::ostringstream oss;
    write_ascii(oss, value, indent);
    return oss.str();
}

auto operator<<(std::ostream& os, const value_t& value) -> std::ostream& {
    write_ascii(os, value);
    return os;
}

} // namespace wirepack
