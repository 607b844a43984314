/**
 * @file ExportAuthorizationGate.hpp
 * @brief Per-type policy evaluation for export requests.
 */

#pragma once

#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_map>
#include "domain/ExportedTypeDefinition.hpp"
#include "domain/Principal.hpp"

namespace exporthub::application {

enum class AuthorizationResult { Allow, Deny };

/**
 * @brief Name of the policy guarding an export type: "<typeName>ExportDataPolicy".
 */
inline std::string PolicyNameFor(const std::string& exportTypeName) {
    return exportTypeName + "ExportDataPolicy";
}

/**
 * @class ExportAuthorizationGate
 * @brief Holds one policy per export type and evaluates it before any work is done.
 *
 * Policies live in an explicit map keyed by policy name. A policy name without an entry
 * is denied.
 */
class ExportAuthorizationGate {
public:
    /** @brief Registers @p policy under PolicyNameFor(@p exportTypeName). */
    void registerPolicy(const std::string& exportTypeName, domain::ExportAuthorizationPolicy policy);

    /**
     * @brief Registers the type's own policy, or a default one requiring its
     * requiredPermission when the definition carries none.
     */
    void registerPolicyFor(const domain::ExportedTypeDefinition& definition);

    /**
     * @brief Evaluates the named policy. Has no side effects besides a log line on denial.
     */
    AuthorizationResult authorize(const domain::Principal& principal,
                                  const domain::ExportDataQuery& query,
                                  const std::string& policyName) const;

    bool hasPolicy(const std::string& policyName) const;

    static bool HasPermission(const domain::Principal& principal, const std::string& permission);
    static bool HasAnyPermission(const domain::Principal& principal, std::initializer_list<const char*> permissions);

private:
    std::unordered_map<std::string, domain::ExportAuthorizationPolicy> m_policies;
    mutable std::mutex m_mutex;
};

} // namespace exporthub::application
