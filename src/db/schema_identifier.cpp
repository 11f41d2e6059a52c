#include "db/schema_identifier.hpp"

#include <format>
#include <stdexcept>

namespace tenantdb {

std::string quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

bool is_system_schema(std::string_view name) {
    return name.starts_with("pg_")
        || name == "information_schema"
        || name == "public";
}

bool SchemaIdentifier::is_valid(std::string_view name) {
    if (name.empty() || name.size() > kMaxIdentifierLength) {
        return false;
    }
    const char first = name.front();
    if (!((first >= 'a' && first <= 'z') || first == '_')) {
        return false;
    }
    for (const char c : name) {
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) {
            return false;
        }
    }
    return true;
}

std::optional<SchemaIdentifier> SchemaIdentifier::parse(std::string_view name) {
    if (!is_valid(name)) {
        return std::nullopt;
    }
    return SchemaIdentifier(std::string(name));
}

SchemaIdentifier SchemaIdentifier::from(std::string_view name) {
    auto id = parse(name);
    if (!id) {
        throw std::invalid_argument(std::format(
            "Invalid schema name '{}': expected [a-z_][a-z0-9_]* of at most {} bytes",
            name, kMaxIdentifierLength));
    }
    return std::move(*id);
}

QualifiedName::QualifiedName(SchemaIdentifier schema, std::string object)
    : schema_(std::move(schema)), object_(std::move(object)) {
    if (object_.empty()) {
        throw std::invalid_argument("Object name must not be empty");
    }
    if (object_.find('\0') != std::string::npos) {
        throw std::invalid_argument("Object name must not contain NUL");
    }
}

std::string QualifiedName::quoted() const {
    return schema_.quoted() + "." + quote_identifier(object_);
}

} // namespace tenantdb
