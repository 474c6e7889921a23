#pragma once

#include "core/fractional_index.hpp"
#include "core/nutty_id.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nutty::blocks {

/**
 * Block content types. Immutable value types.
 */

struct Page {
    std::string title;

    bool operator==(const Page&) const = default;
};

struct Heading {
    std::string markdown;

    bool operator==(const Heading&) const = default;
};

struct Paragraph {
    std::string markdown;

    bool operator==(const Paragraph&) const = default;
};

/**
 * BlockContent - Sum type of everything a block can hold.
 */
using BlockContent = std::variant<Page, Heading, Paragraph>;

enum class BlockKind {
    Page,
    Heading,
    Paragraph
};

[[nodiscard]] constexpr BlockKind get_kind(const BlockContent& content) {
    return std::visit([](const auto& c) -> BlockKind {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Page>) return BlockKind::Page;
        else if constexpr (std::is_same_v<T, Heading>) return BlockKind::Heading;
        else return BlockKind::Paragraph;
    }, content);
}

/**
 * Name used as the JSON "kind" discriminator.
 */
[[nodiscard]] constexpr std::string_view kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Page: return "Page";
        case BlockKind::Heading: return "Heading";
        case BlockKind::Paragraph: return "Paragraph";
    }
    return "Unknown";
}

[[nodiscard]] inline std::optional<BlockKind> parse_kind(std::string_view name) {
    if (name == "Page") return BlockKind::Page;
    if (name == "Heading") return BlockKind::Heading;
    if (name == "Paragraph") return BlockKind::Paragraph;
    return std::nullopt;
}

/**
 * The title of a page or the markdown of any other block.
 */
[[nodiscard]] inline std::string get_text(const BlockContent& content) {
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Page>) return c.title;
        else return c.markdown;
    }, content);
}

/**
 * ContentBlock - One node of the content tree.
 *
 * Siblings (blocks sharing parent_id) are ordered by f_index. The
 * identifier and creation time never change after create(); reordering
 * replaces f_index on the moved block only.
 */
struct ContentBlock {
    NuttyId id;
    std::optional<NuttyId> parent_id;
    FractionalIndex f_index;
    BlockContent content;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const ContentBlock&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a block with a freshly generated identifier.
 */
[[nodiscard]] ContentBlock create(std::optional<NuttyId> parent_id,
                                  FractionalIndex f_index,
                                  BlockContent content);

[[nodiscard]] ContentBlock create(NuttyId id,
                                  std::optional<NuttyId> parent_id,
                                  FractionalIndex f_index,
                                  BlockContent content,
                                  Timestamp now);

[[nodiscard]] inline ContentBlock with_content(ContentBlock block, BlockContent content,
                                               Timestamp now = Timestamp::now()) {
    block.content = std::move(content);
    block.updated_at = now;
    return block;
}

[[nodiscard]] inline ContentBlock with_parent(ContentBlock block, std::optional<NuttyId> parent_id,
                                              Timestamp now = Timestamp::now()) {
    block.parent_id = std::move(parent_id);
    block.updated_at = now;
    return block;
}

/**
 * Order key for inserting at `position` (0 = first) into `siblings`, which
 * must already be sorted by f_index. Positions past the end append.
 *
 * An empty list gets the midpoint of start() and end() so there is room on
 * both sides. Inserting before a sibling whose key is start() fails with
 * ErrorKind::DegenerateInterval, as does inserting between two siblings
 * with equal keys.
 */
[[nodiscard]] Res<FractionalIndex> index_for_insert(const std::vector<ContentBlock>& siblings,
                                                    size_t position);

/**
 * Re-parent and/or reorder a block. `blocks` is the current block set (it
 * may contain `block` itself); the new key is computed against the new
 * siblings without `block`. Only the returned block changes. Moving a block
 * under itself or one of its descendants fails with CyclicParent.
 */
[[nodiscard]] Res<ContentBlock> move_to(const ContentBlock& block,
                                        std::optional<NuttyId> new_parent,
                                        size_t position,
                                        const std::vector<ContentBlock>& blocks,
                                        Timestamp now = Timestamp::now());

/**
 * Blocks whose parent is `parent_id` (root blocks for nullopt), sorted by
 * f_index with the identifier breaking ties.
 */
[[nodiscard]] std::vector<ContentBlock> children_of(const std::optional<NuttyId>& parent_id,
                                                    const std::vector<ContentBlock>& blocks);

[[nodiscard]] inline std::vector<ContentBlock> root_blocks(const std::vector<ContentBlock>& blocks) {
    return children_of(std::nullopt, blocks);
}

/**
 * Parent, grandparent, ... of `block`, nearest first. Stops at a missing
 * parent or a cycle.
 */
[[nodiscard]] std::vector<ContentBlock> ancestors_of(const ContentBlock& block,
                                                     const std::vector<ContentBlock>& blocks);

/**
 * Every block below `block`, level by level, each level in sibling order.
 */
[[nodiscard]] std::vector<ContentBlock> descendants_of(const ContentBlock& block,
                                                       const std::vector<ContentBlock>& blocks);

/**
 * Depth-first, sibling-ordered listing of the whole tree.
 */
[[nodiscard]] std::vector<ContentBlock> flatten_tree(const std::vector<ContentBlock>& blocks);

} // namespace nutty::blocks
