#pragma once

#include <IResponse.hpp>
#include "adapters/primary/RequestContext.hpp"
#include "domain/errors/CredentialException.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <iostream>

namespace authcore::adapters::primary {

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

inline int httpStatusFor(domain::ErrorCode code) {
    switch (code) {
        case domain::ErrorCode::VALIDATION_ERROR: return 400;
        case domain::ErrorCode::NOT_FOUND:        return 404;
        case domain::ErrorCode::EXPIRED:          return 404;
        case domain::ErrorCode::DIGEST_MISMATCH:  return 404;
        case domain::ErrorCode::ALREADY_EXISTS:   return 409;
        case domain::ErrorCode::STORAGE_FAILURE:  return 500;
        case domain::ErrorCode::UNAUTHENTICATED:  return 401;
        default: return 500;
    }
}

/**
 * @brief Ответ по CredentialException; причина сбоя хранилища клиенту не уходит
 */
inline void sendCredentialError(IResponse& res, const domain::CredentialException& e) {
    if (e.code() == domain::ErrorCode::STORAGE_FAILURE) {
        sendError(res, 500, "Internal server error");
        return;
    }
    sendError(res, httpStatusFor(e.code()), e.what());
}

/**
 * @brief То же для обработчиков сессии: отозванная сессия стирается из cookie
 */
inline void sendCredentialError(IResponse& res, RequestContext& ctx, const domain::CredentialException& e) {
    if (e.code() == domain::ErrorCode::UNAUTHENTICATED) {
        ctx.session.clear();
    }
    sendCredentialError(res, e);
}

} // namespace authcore::adapters::primary
