#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tenantdb {

/**
 * @brief Error categories for the tenant engine
 */
enum class ErrorCategory {
    NONE,
    TENANT_NOT_FOUND,
    SCHEMA_NOT_FOUND,
    CONTEXT_MISUSE,
    MIGRATION_APPLY_ERROR,
    PATCH_APPLY_ERROR,
    PROVISIONING_ERROR,
    CONNECTION_ERROR,
    ROUTING_ERROR,
    DATABASE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] constexpr std::string_view category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::TENANT_NOT_FOUND:      return "tenant_not_found";
        case ErrorCategory::SCHEMA_NOT_FOUND:      return "schema_not_found";
        case ErrorCategory::CONTEXT_MISUSE:        return "context_misuse";
        case ErrorCategory::MIGRATION_APPLY_ERROR: return "migration_apply_error";
        case ErrorCategory::PATCH_APPLY_ERROR:     return "patch_apply_error";
        case ErrorCategory::PROVISIONING_ERROR:    return "provisioning_error";
        case ErrorCategory::CONNECTION_ERROR:      return "connection_error";
        case ErrorCategory::ROUTING_ERROR:         return "routing_error";
        case ErrorCategory::DATABASE_ERROR:        return "database_error";
        case ErrorCategory::CONFIG_ERROR:          return "config_error";
        case ErrorCategory::INTERNAL_ERROR:        return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exception hierarchy
// ============================================================================

class TenantDbError : public std::runtime_error {
public:
    TenantDbError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// Directory miss. Not retryable without a corrected identifier.
class TenantNotFoundError : public TenantDbError {
public:
    explicit TenantNotFoundError(const std::string& identifier)
        : TenantDbError(ErrorCategory::TENANT_NOT_FOUND,
                        "Tenant not found: " + identifier),
          identifier_(identifier) {}

    [[nodiscard]] const std::string& identifier() const noexcept { return identifier_; }

private:
    std::string identifier_;
};

/// Routing target schema does not exist; the tenant needs provisioning.
class SchemaNotFoundError : public TenantDbError {
public:
    explicit SchemaNotFoundError(const std::string& schema)
        : TenantDbError(ErrorCategory::SCHEMA_NOT_FOUND,
                        "Schema does not exist: " + schema),
          schema_(schema) {}

    [[nodiscard]] const std::string& schema() const noexcept { return schema_; }

private:
    std::string schema_;
};

/// Programming defect: context set twice, missing, or a session asked to leave its schema.
class ContextMisuseError : public TenantDbError {
public:
    explicit ContextMisuseError(const std::string& message)
        : TenantDbError(ErrorCategory::CONTEXT_MISUSE, message) {}
};

class MigrationApplyError : public TenantDbError {
public:
    MigrationApplyError(const std::string& schema, const std::string& message)
        : TenantDbError(ErrorCategory::MIGRATION_APPLY_ERROR, message), schema_(schema) {}

    [[nodiscard]] const std::string& schema() const noexcept { return schema_; }

private:
    std::string schema_;
};

class PatchApplyError : public TenantDbError {
public:
    PatchApplyError(const std::string& patch_id, const std::string& message)
        : TenantDbError(ErrorCategory::PATCH_APPLY_ERROR, message), patch_id_(patch_id) {}

    [[nodiscard]] const std::string& patch_id() const noexcept { return patch_id_; }

private:
    std::string patch_id_;
};

/// Pool exhausted or connection could not be established. Transient.
class ConnectionError : public TenantDbError {
public:
    explicit ConnectionError(const std::string& message)
        : TenantDbError(ErrorCategory::CONNECTION_ERROR, message) {}
};

/// The session's active schema could not be confirmed after SET search_path.
class RoutingError : public TenantDbError {
public:
    explicit RoutingError(const std::string& message)
        : TenantDbError(ErrorCategory::ROUTING_ERROR, message) {}
};

/// Statement failed inside the database.
class DatabaseError : public TenantDbError {
public:
    explicit DatabaseError(const std::string& message)
        : TenantDbError(ErrorCategory::DATABASE_ERROR, message) {}
};

} // namespace tenantdb
