#include "swarmsync/network.hpp"

#include <nlohmann/json.hpp>

namespace swarmsync {

namespace {

    request_error error_for_status(int16_t status, std::string message) {
        switch (status) {
            case 406:
            case 425:
                return request_error{
                        RequestErrorKind::clock_out_of_sync,
                        "The user's clock is out of sync with the service node network.",
                        status};
            case 429:
                return request_error{RequestErrorKind::rate_limited, std::move(message), status};
            case 401:
            case 403:
                return request_error{RequestErrorKind::unauthorized, std::move(message), status};
            default: return request_error{RequestErrorKind::transport, std::move(message), status};
        }
    }

}  // namespace

std::optional<request_error> extract_error(int16_t status_code, std::string_view body) {
    bool root_failed = status_code < 200 || status_code > 299;
    if (body.empty()) {
        if (root_failed)
            return error_for_status(
                    status_code, "Failed with status code: " + std::to_string(status_code) + ".");
        return std::nullopt;
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        if (root_failed)
            return error_for_status(status_code, std::string{body});
        return request_error{RequestErrorKind::invalid_response, std::string{body}, status_code};
    }

    // If the root request failed then try to extract the 'reason', otherwise just use the response
    // as the error
    if (root_failed) {
        if (response.is_object() && response.contains("reason") && response["reason"].is_string())
            return error_for_status(status_code, response["reason"].get<std::string>());
        return error_for_status(status_code, std::string{body});
    }

    // Not a batch/sequence request: success
    if (!response.is_object() || !response.contains("results"))
        return std::nullopt;

    auto& results = response["results"];
    if (!results.is_array())
        return request_error{RequestErrorKind::invalid_response, std::string{body}, status_code};

    int single_status = -1;
    std::optional<std::string> error_body;
    for (auto& result : results) {
        if (!result.is_object() || !result.contains("code") || !result["code"].is_number_integer())
            return request_error{
                    RequestErrorKind::invalid_response, std::string{body}, status_code};

        auto code = result["code"].get<int>();

        // Differing codes need specific handling by the caller
        if (single_status != -1 && code != single_status)
            return std::nullopt;
        single_status = code;

        if (result.contains("body") && result["body"].is_string())
            error_body = result["body"].get<std::string>();
    }

    if (single_status != -1 && (single_status < 200 || single_status > 299))
        return error_for_status(
                static_cast<int16_t>(single_status),
                error_body.value_or(
                        "Failed with status code: " + std::to_string(single_status) + "."));

    return std::nullopt;
}

}  // namespace swarmsync
