/**
 * @file patch.hpp
 * @brief Ordered document edits produced by mutating admission stages.
 * @author Dimitris Kafetzis
 *
 * A Patch is a list of add/remove/replace operations addressed by JSON
 * pointer (RFC 6901). It serializes to, and parses from, RFC 6902 JSON Patch.
 * Application is all-or-nothing: the input document is never modified.
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cluster_gate {

enum class PatchOp : uint8_t {
    Add,
    Remove,
    Replace
};

[[nodiscard]] constexpr std::string_view to_string(PatchOp op) noexcept {
    switch (op) {
        case PatchOp::Add:     return "add";
        case PatchOp::Remove:  return "remove";
        case PatchOp::Replace: return "replace";
    }
    return "unknown";
}

struct PatchOperation {
    PatchOp op = PatchOp::Add;
    std::string path;           ///< JSON pointer, e.g. "/metadata/labels/app"
    nlohmann::json value;       ///< Ignored for Remove

    bool operator==(const PatchOperation&) const = default;
};

/**
 * @brief An ordered list of document edits.
 */
class Patch {
public:
    Patch() = default;

    Patch& add(std::string path, nlohmann::json value);
    Patch& remove(std::string path);
    Patch& replace(std::string path, nlohmann::json value);
    Patch& append(const Patch& other);

    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return ops_.size(); }
    [[nodiscard]] const std::vector<PatchOperation>& operations() const noexcept { return ops_; }

    /// RFC 6902 representation: [{"op":"add","path":"...","value":...}, ...]
    [[nodiscard]] nlohmann::json to_json() const;

    /// Parse an RFC 6902 array. Only add/remove/replace are accepted.
    static Result<Patch> from_json(const nlohmann::json& doc);

    bool operator==(const Patch&) const = default;

private:
    std::vector<PatchOperation> ops_;
};

/**
 * @brief Apply a patch to a copy of @p document.
 *
 * Returns the patched document, or an InvalidArgument error naming the first
 * operation that could not be applied. @p document is left untouched either way.
 */
Result<nlohmann::json> apply_patch(const nlohmann::json& document, const Patch& patch);

/// Escape a single reference token ("~" → "~0", "/" → "~1").
[[nodiscard]] std::string escape_pointer_token(std::string_view token);

/// Build a pointer from unescaped tokens: {"metadata","labels","a/b"} → "/metadata/labels/a~1b".
[[nodiscard]] std::string make_pointer(std::initializer_list<std::string_view> tokens);

/**
 * @brief Operations that ensure every parent object on @p tokens exists in
 *        @p document, followed by an add of @p value at the leaf.
 *
 * JSON Patch "add" refuses to create intermediate objects; mutating stages
 * use this to set nested fields such as metadata.labels.<key>.
 */
[[nodiscard]] Patch set_nested(const nlohmann::json& document,
                               const std::vector<std::string>& tokens,
                               nlohmann::json value);

}  // namespace cluster_gate
