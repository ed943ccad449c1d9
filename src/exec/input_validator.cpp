#include "toolgate/exec/input_validator.hpp"

#include <algorithm>
#include <system_error>

namespace toolgate::exec {

namespace fs = std::filesystem;

namespace {

auto reject(RejectionKind kind, std::string message, std::string detail,
            bool security = false) -> ValidationError {
    return ValidationError{
        .kind = kind,
        .message = std::move(message),
        .detail = std::move(detail),
        .security_violation = security,
    };
}

auto describe_byte(char c) -> std::string {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte >= 0x7f) {
        static constexpr std::string_view hex = "0123456789abcdef";
        std::string out = "0x";
        out += hex[byte >> 4];
        out += hex[byte & 0x0f];
        return out;
    }
    return std::string("'") + c + "'";
}

} // anonymous namespace

auto is_tool_name_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

auto is_forbidden_argument_byte(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7f) {
        return true;
    }
    return kForbiddenArgumentChars.find(c) != std::string_view::npos;
}

auto validate_tool_name(std::string_view name) -> Validation {
    if (name.empty()) {
        return std::unexpected(reject(RejectionKind::InvalidToolName,
            "tool name is required", "empty tool name", true));
    }
    if (name.size() > kMaxToolNameLength) {
        return std::unexpected(reject(RejectionKind::InvalidToolName,
            "tool name is too long",
            "tool name length " + std::to_string(name.size()) + " exceeds " +
                std::to_string(kMaxToolNameLength), true));
    }

    auto bad = std::ranges::find_if_not(name, is_tool_name_char);
    if (bad != name.end()) {
        return std::unexpected(reject(RejectionKind::InvalidToolName,
            "tool name contains invalid characters",
            "byte " + describe_byte(*bad) + " at offset " +
                std::to_string(std::distance(name.begin(), bad)),
            true));
    }
    return {};
}

auto sanitize_arguments(const std::vector<std::string>& args) -> Validation {
    if (args.size() > kMaxArgumentCount) {
        return std::unexpected(reject(RejectionKind::DisallowedArgument,
            "too many arguments",
            std::to_string(args.size()) + " arguments exceed the limit of " +
                std::to_string(kMaxArgumentCount)));
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& token = args[i];
        if (token.size() > kMaxArgumentLength) {
            return std::unexpected(reject(RejectionKind::DisallowedArgument,
                "argument is too long",
                "argument " + std::to_string(i) + " has " + std::to_string(token.size()) +
                    " bytes, limit " + std::to_string(kMaxArgumentLength)));
        }

        auto bad = std::ranges::find_if(token, is_forbidden_argument_byte);
        if (bad != token.end()) {
            return std::unexpected(reject(RejectionKind::DisallowedArgument,
                "arguments contain potentially dangerous characters",
                "argument " + std::to_string(i) + " contains " + describe_byte(*bad),
                true));
        }
    }
    return {};
}

auto is_path_within(const fs::path& root, const fs::path& candidate) -> bool {
    auto [root_it, cand_it] = std::mismatch(root.begin(), root.end(),
                                            candidate.begin(), candidate.end());
    if (root_it == root.end()) {
        return true;
    }
    // A trailing empty segment ("/sandbox/") is not a real component.
    return root_it->empty() && std::next(root_it) == root.end();
}

auto validate_working_directory(std::string_view requested,
                                const fs::path& sandbox_root)
    -> std::expected<fs::path, ValidationError> {
    if (std::ranges::any_of(requested, [](char c) {
            auto byte = static_cast<unsigned char>(c);
            return byte < 0x20 || byte == 0x7f;
        })) {
        return std::unexpected(reject(RejectionKind::PathEscapesSandbox,
            "working directory contains control characters",
            "control byte in working_dir"));
    }

    std::error_code ec;
    auto root = fs::canonical(sandbox_root, ec);
    if (ec) {
        return std::unexpected(reject(RejectionKind::PathEscapesSandbox,
            "sandbox root is unavailable",
            sandbox_root.string() + ": " + ec.message()));
    }

    fs::path path(requested);
    auto candidate = path.is_absolute() ? path : root / path;

    auto resolved = fs::canonical(candidate, ec);
    if (ec) {
        return std::unexpected(reject(RejectionKind::PathEscapesSandbox,
            "working directory does not exist inside the sandbox",
            candidate.string() + ": " + ec.message()));
    }

    if (!is_path_within(root, resolved)) {
        return std::unexpected(reject(RejectionKind::PathEscapesSandbox,
            "working directory escapes the sandbox",
            resolved.string() + " is outside " + root.string()));
    }

    if (!fs::is_directory(resolved, ec) || ec) {
        return std::unexpected(reject(RejectionKind::PathEscapesSandbox,
            "working directory is not a directory",
            resolved.string()));
    }

    return resolved;
}

} // namespace toolgate::exec
