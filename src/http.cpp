/*
 * Copyright 2020-present NAVER Corp.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstring>
#include <regex>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "logging.h"
#include "http.h"

namespace tracebridge {

    SpanStatus span_status_from_http(int64_t status_code) noexcept {
        if (status_code < http_status::CLIENT_ERROR_MIN) {
            return SPAN_STATUS_OK;
        }

        switch (status_code) {
            case http_status::BAD_REQUEST: return SPAN_STATUS_INVALID_ARGUMENT;
            case http_status::UNAUTHORIZED: return SPAN_STATUS_UNAUTHENTICATED;
            case http_status::FORBIDDEN: return SPAN_STATUS_PERMISSION_DENIED;
            case http_status::NOT_FOUND: return SPAN_STATUS_NOT_FOUND;
            case http_status::CONFLICT: return SPAN_STATUS_ALREADY_EXISTS;
            case http_status::TOO_MANY_REQUESTS: return SPAN_STATUS_RESOURCE_EXHAUSTED;
            case http_status::CLIENT_CLOSED_REQUEST: return SPAN_STATUS_CANCELLED;
            case http_status::INTERNAL_SERVER_ERROR: return SPAN_STATUS_INTERNAL_ERROR;
            case http_status::NOT_IMPLEMENTED: return SPAN_STATUS_UNIMPLEMENTED;
            case http_status::SERVICE_UNAVAILABLE: return SPAN_STATUS_UNAVAILABLE;
            case http_status::GATEWAY_TIMEOUT: return SPAN_STATUS_DEADLINE_EXCEEDED;
            default: break;
        }

        if (status_code < http_status::SERVER_ERROR_MIN) {
            return SPAN_STATUS_INVALID_ARGUMENT;
        }
        if (status_code <= http_status::SERVER_ERROR_MAX) {
            return SPAN_STATUS_INTERNAL_ERROR;
        }
        return SPAN_STATUS_UNKNOWN_ERROR;
    }

    SpanStatus span_status_from_grpc(int64_t status_code) noexcept {
        switch (status_code) {
            case 0: return SPAN_STATUS_OK;
            case 1: return SPAN_STATUS_CANCELLED;
            case 2: return SPAN_STATUS_UNKNOWN_ERROR;
            case 3: return SPAN_STATUS_INVALID_ARGUMENT;
            case 4: return SPAN_STATUS_DEADLINE_EXCEEDED;
            case 5: return SPAN_STATUS_NOT_FOUND;
            case 6: return SPAN_STATUS_ALREADY_EXISTS;
            case 7: return SPAN_STATUS_PERMISSION_DENIED;
            case 8: return SPAN_STATUS_RESOURCE_EXHAUSTED;
            case 9: return SPAN_STATUS_FAILED_PRECONDITION;
            case 10: return SPAN_STATUS_ABORTED;
            case 11: return SPAN_STATUS_OUT_OF_RANGE;
            case 12: return SPAN_STATUS_UNIMPLEMENTED;
            case 13: return SPAN_STATUS_INTERNAL_ERROR;
            case 14: return SPAN_STATUS_UNAVAILABLE;
            case 15: return SPAN_STATUS_DATA_LOSS;
            case 16: return SPAN_STATUS_UNAUTHENTICATED;
            default: return SPAN_STATUS_UNKNOWN_ERROR;
        }
    }

    std::string Dsn::apiBaseUrl() const {
        std::string url = absl::StrCat(scheme, "://", host);
        if (!port.empty()) {
            absl::StrAppend(&url, ":", port);
        }
        absl::StrAppend(&url, "/");
        if (!path.empty()) {
            absl::StrAppend(&url, path, "/");
        }
        absl::StrAppend(&url, "api/", project_id, "/");
        return url;
    }

    std::optional<Dsn> parse_dsn(std::string_view dsn) {
        Dsn result;

        const auto scheme_end = dsn.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::nullopt;
        }
        result.scheme = std::string(dsn.substr(0, scheme_end));
        auto rest = dsn.substr(scheme_end + 3);

        const auto at = rest.find('@');
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        auto user_info = rest.substr(0, at);
        if (const auto colon = user_info.find(':'); colon != std::string_view::npos) {
            user_info = user_info.substr(0, colon);
        }
        if (user_info.empty()) {
            return std::nullopt;
        }
        result.public_key = std::string(user_info);
        rest = rest.substr(at + 1);

        const auto slash = rest.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        auto authority = rest.substr(0, slash);
        if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            result.port = std::string(authority.substr(colon + 1));
            authority = authority.substr(0, colon);
        }
        if (authority.empty()) {
            return std::nullopt;
        }
        result.host = std::string(authority);

        auto path = rest.substr(slash + 1);
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        const auto last = path.rfind('/');
        if (last == std::string_view::npos) {
            result.project_id = std::string(path);
        } else {
            result.path = std::string(path.substr(0, last));
            result.project_id = std::string(path.substr(last + 1));
        }
        if (result.project_id.empty()) {
            return std::nullopt;
        }

        return result;
    }

    HttpUrlFilter::HttpUrlFilter(const std::vector<std::string>& cfg) {
        pattern_.reserve(cfg.size());
        for (const auto& pattern_str : cfg) {
            try {
                pattern_.emplace_back(convert_to_regex(pattern_str));
            } catch (const std::regex_error& e) {
                LOG_WARN("Invalid URL pattern '{}': {}", pattern_str, e.what());
            }
        }
    }

    bool HttpUrlFilter::isFiltered(std::string_view url) const {
        const std::string url_str(url);
        for (const auto& pattern : pattern_) {
            if (std::regex_match(url_str, pattern)) {
                return true;
            }
        }
        return false;
    }

    std::string HttpUrlFilter::convert_to_regex(std::string_view antPath) {
        std::string result;
        result.reserve(antPath.size() + 10);
        result += '^';

        bool after_star = false;
        for (char c : antPath) {
            if (after_star) {
                if (c == '*') {
                    result += ".*";
                } else {
                    result += "[^/]*";
                    append_escaped_char(result, c);
                }
                after_star = false;
            } else if (c == '*') {
                after_star = true;
            } else {
                append_escaped_char(result, c);
            }
        }
        if (after_star) {
            result += "[^/]*";
        }

        result += '$';
        return result;
    }

    void HttpUrlFilter::append_escaped_char(std::string& buf, char c) {
        constexpr char special_chars[] = ".+^$[]{}()|?\\*";

        if (std::strchr(special_chars, c) != nullptr) {
            buf += '\\';
        }
        buf += c;
    }

    BackendUrlFilter::BackendUrlFilter(const Dsn& dsn, const std::vector<std::string>& exclude_url)
        : api_base_url_(dsn.apiBaseUrl()), exclude_url_(exclude_url) {}

    bool BackendUrlFilter::isBackendRequest(std::string_view url) const {
        if (url.empty()) {
            return false;
        }
        if (absl::StartsWithIgnoreCase(absl::string_view(url.data(), url.size()), api_base_url_)) {
            return true;
        }
        return exclude_url_.isFiltered(url);
    }

}
