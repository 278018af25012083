// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printdeck {

/**
 * @brief Error types for printer backend operations
 */
enum class PrinterErrorType {
    NONE,              // No error
    CONNECTION_FAILED, // Printer unreachable or refused the connection
    TIMEOUT,           // Request timed out
    HTTP_ERROR,        // Printer answered with a non-success status
    AUTH_FAILED,       // Serial number / check code rejected
    PARSE_ERROR,       // Response body was not the expected JSON
    NOT_CONNECTED,     // Operation needs a connected backend
    NOT_SUPPORTED,     // Model does not support the operation
    UNKNOWN            // Unknown error
};

/**
 * @brief Error information for a failed backend operation
 */
struct PrinterError {
    PrinterErrorType type = PrinterErrorType::NONE;
    int code = 0;          // HTTP status or printer API code if applicable
    std::string message;   // Human-readable error message
    std::string operation; // Operation that failed ("connect", "get_status", ...)

    bool has_error() const {
        return type != PrinterErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case PrinterErrorType::NONE:
            return "NONE";
        case PrinterErrorType::CONNECTION_FAILED:
            return "CONNECTION_FAILED";
        case PrinterErrorType::TIMEOUT:
            return "TIMEOUT";
        case PrinterErrorType::HTTP_ERROR:
            return "HTTP_ERROR";
        case PrinterErrorType::AUTH_FAILED:
            return "AUTH_FAILED";
        case PrinterErrorType::PARSE_ERROR:
            return "PARSE_ERROR";
        case PrinterErrorType::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case PrinterErrorType::NOT_SUPPORTED:
            return "NOT_SUPPORTED";
        case PrinterErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-facing message
     */
    std::string user_message() const {
        switch (type) {
        case PrinterErrorType::CONNECTION_FAILED:
            return "Could not connect to the printer. Check that it is powered on and on the "
                   "same network.";
        case PrinterErrorType::TIMEOUT:
            return "The printer did not respond in time.";
        case PrinterErrorType::AUTH_FAILED:
            return "The printer rejected the check code.";
        case PrinterErrorType::NOT_CONNECTED:
            return "The printer is not connected.";
        case PrinterErrorType::NOT_SUPPORTED:
            return "This printer model does not support that operation.";
        default:
            break;
        }
        if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static PrinterError connection_failed(const std::string& op, const std::string& detail) {
        PrinterError err;
        err.type = PrinterErrorType::CONNECTION_FAILED;
        err.operation = op;
        err.message = "Connection failed: " + detail;
        return err;
    }

    static PrinterError timeout(const std::string& op, uint32_t timeout_ms) {
        PrinterError err;
        err.type = PrinterErrorType::TIMEOUT;
        err.operation = op;
        err.message = "Request timeout after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    static PrinterError http_error(const std::string& op, int status) {
        PrinterError err;
        err.type = PrinterErrorType::HTTP_ERROR;
        err.code = status;
        err.operation = op;
        err.message = "HTTP " + std::to_string(status);
        return err;
    }

    static PrinterError auth_failed(const std::string& op, int api_code, const std::string& msg) {
        PrinterError err;
        err.type = PrinterErrorType::AUTH_FAILED;
        err.code = api_code;
        err.operation = op;
        err.message = msg;
        return err;
    }

    static PrinterError parse_error(const std::string& op, const std::string& what) {
        PrinterError err;
        err.type = PrinterErrorType::PARSE_ERROR;
        err.operation = op;
        err.message = "JSON parse error: " + what;
        return err;
    }

    static PrinterError not_connected(const std::string& op) {
        PrinterError err;
        err.type = PrinterErrorType::NOT_CONNECTED;
        err.operation = op;
        err.message = "Backend not connected";
        return err;
    }

    static PrinterError not_supported(const std::string& op) {
        PrinterError err;
        err.type = PrinterErrorType::NOT_SUPPORTED;
        err.operation = op;
        err.message = "Operation not supported: " + op;
        return err;
    }
};

} // namespace printdeck
