/**
 * @file ExportAuthorizationGate.cpp
 * @brief Implementation of ExportAuthorizationGate.
 */

#include "application/ExportAuthorizationGate.hpp"
#include <iostream>

namespace exporthub::application {

void ExportAuthorizationGate::registerPolicy(const std::string& exportTypeName,
                                             domain::ExportAuthorizationPolicy policy) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_policies[PolicyNameFor(exportTypeName)] = std::move(policy);
}

void ExportAuthorizationGate::registerPolicyFor(const domain::ExportedTypeDefinition& definition) {
    if (definition.authorizationPolicy) {
        registerPolicy(definition.name, definition.authorizationPolicy);
        return;
    }

    std::string required = definition.requiredPermission;
    registerPolicy(definition.name, [required](const domain::Principal& principal, const domain::ExportDataQuery&) {
        return required.empty() || principal.hasPermission(required);
    });
}

AuthorizationResult ExportAuthorizationGate::authorize(const domain::Principal& principal,
                                                       const domain::ExportDataQuery& query,
                                                       const std::string& policyName) const {
    domain::ExportAuthorizationPolicy policy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_policies.find(policyName);
        if (it != m_policies.end()) {
            policy = it->second;
        }
    }

    if (!policy) {
        std::cerr << "[ExportAuthorizationGate] No policy registered as " << policyName
                  << ", denying " << principal.userName << std::endl;
        return AuthorizationResult::Deny;
    }

    bool allowed = false;
    try {
        allowed = policy(principal, query);
    } catch (const std::exception& e) {
        std::cerr << "[ExportAuthorizationGate] Policy " << policyName << " threw: " << e.what() << std::endl;
        allowed = false;
    }

    if (!allowed) {
        std::cerr << "[ExportAuthorizationGate] " << policyName << " denied " << principal.userName << std::endl;
        return AuthorizationResult::Deny;
    }
    return AuthorizationResult::Allow;
}

bool ExportAuthorizationGate::hasPolicy(const std::string& policyName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_policies.count(policyName) > 0;
}

bool ExportAuthorizationGate::HasPermission(const domain::Principal& principal, const std::string& permission) {
    return principal.hasPermission(permission);
}

bool ExportAuthorizationGate::HasAnyPermission(const domain::Principal& principal,
                                               std::initializer_list<const char*> permissions) {
    for (const char* permission : permissions) {
        if (principal.hasPermission(permission)) {
            return true;
        }
    }
    return false;
}

} // namespace exporthub::application
