#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

/// Stateless request checks. None of these touch the registry or spawn
/// anything; `validate_working_directory` only reads the filesystem.

static constexpr std::size_t kMaxToolNameLength = 64;
static constexpr std::size_t kMaxArgumentCount = 128;
static constexpr std::size_t kMaxArgumentLength = 4096;

using Validation = std::expected<void, ValidationError>;

/// Shell metacharacters that are never accepted inside an argument token.
inline constexpr std::string_view kForbiddenArgumentChars = ";&|`$()<>";

/// True for bytes that may appear in a tool name: [A-Za-z0-9._-].
auto is_tool_name_char(char c) -> bool;

/// True for control bytes (including newline and DEL) and shell metacharacters.
auto is_forbidden_argument_byte(char c) -> bool;

/// Tool name must match [A-Za-z0-9._-]{1,64}.
auto validate_tool_name(std::string_view name) -> Validation;

/// Checks a pre-tokenized argument list. Rejection is based on the raw bytes
/// of each token; quoting inside a token does not make a metacharacter safe.
auto sanitize_arguments(const std::vector<std::string>& args) -> Validation;

/// Canonicalizes `requested` (relative paths are taken from `sandbox_root`)
/// and requires the result to be an existing directory at or below the
/// canonical sandbox root. Returns the canonical path.
auto validate_working_directory(std::string_view requested,
                                const std::filesystem::path& sandbox_root)
    -> std::expected<std::filesystem::path, ValidationError>;

/// Segment-wise containment test on already canonical paths.
/// `/sandbox2` is not within `/sandbox`.
auto is_path_within(const std::filesystem::path& root,
                    const std::filesystem::path& candidate) -> bool;

} // namespace toolgate::exec
