#include "core/content_block.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <unordered_set>

namespace nutty::blocks {

namespace {

bool sibling_less(const ContentBlock& a, const ContentBlock& b) {
    const auto order = a.f_index.compare(b.f_index);
    if (order != 0) return order < 0;
    return a.id < b.id;
}

// A key above `last` when `last` is not below end(): appending '~' always
// increases the value, and the mean of the two lies between them.
Res<FractionalIndex> index_after_last(const FractionalIndex& last) {
    if (last < FractionalIndex::end()) {
        return FractionalIndex::between(last, FractionalIndex::end());
    }
    return FractionalIndex::from_string(last.value() + FractionalIndex::MAX_CHAR)
        .and_then([&](const FractionalIndex& bound) {
            return FractionalIndex::between(last, bound);
        });
}

} // namespace

ContentBlock create(std::optional<NuttyId> parent_id,
                    FractionalIndex f_index,
                    BlockContent content) {
    return create(NuttyId::now(), std::move(parent_id), std::move(f_index),
                  std::move(content), Timestamp::now());
}

ContentBlock create(NuttyId id,
                    std::optional<NuttyId> parent_id,
                    FractionalIndex f_index,
                    BlockContent content,
                    Timestamp now) {
    return ContentBlock{
        .id = std::move(id),
        .parent_id = std::move(parent_id),
        .f_index = std::move(f_index),
        .content = std::move(content),
        .created_at = now,
        .updated_at = now
    };
}

Res<FractionalIndex> index_for_insert(const std::vector<ContentBlock>& siblings,
                                      size_t position) {
    if (siblings.empty()) {
        return FractionalIndex::between(FractionalIndex::start(), FractionalIndex::end());
    }
    if (position == 0) {
        return FractionalIndex::between(FractionalIndex::start(), siblings.front().f_index);
    }
    if (position >= siblings.size()) {
        return index_after_last(siblings.back().f_index);
    }
    return FractionalIndex::between(siblings[position - 1].f_index, siblings[position].f_index);
}

Res<ContentBlock> move_to(const ContentBlock& block,
                          std::optional<NuttyId> new_parent,
                          size_t position,
                          const std::vector<ContentBlock>& blocks,
                          Timestamp now) {
    if (new_parent.has_value()) {
        const auto& target = *new_parent;
        const auto below = descendants_of(block, blocks);
        if (target == block.id ||
            std::any_of(below.begin(), below.end(),
                        [&](const ContentBlock& b) { return b.id == target; })) {
            return Res<ContentBlock>::err(Error{ErrorKind::CyclicParent,
                "Cannot move block " + block.id.to_wire_string() + " into its own subtree at " +
                target.to_wire_string()});
        }
    }

    auto siblings = children_of(new_parent, blocks);
    std::erase_if(siblings, [&](const ContentBlock& b) { return b.id == block.id; });

    return index_for_insert(siblings, position).map([&](const FractionalIndex& f_index) {
        auto moved = block;
        moved.parent_id = std::move(new_parent);
        moved.f_index = f_index;
        moved.updated_at = now;
        return moved;
    });
}

std::vector<ContentBlock> children_of(const std::optional<NuttyId>& parent_id,
                                      const std::vector<ContentBlock>& blocks) {
    std::vector<ContentBlock> children;
    for (const auto& block : blocks) {
        if (block.parent_id == parent_id) {
            children.push_back(block);
        }
    }
    std::sort(children.begin(), children.end(), sibling_less);
    return children;
}

std::vector<ContentBlock> ancestors_of(const ContentBlock& block,
                                       const std::vector<ContentBlock>& blocks) {
    std::vector<ContentBlock> ancestors;
    std::unordered_set<Uuid> seen{block.id.uuid()};

    auto current = block.parent_id;
    while (current.has_value() && seen.insert(current->uuid()).second) {
        auto it = std::find_if(blocks.begin(), blocks.end(),
            [&](const ContentBlock& b) { return b.id == *current; });
        if (it == blocks.end()) break;

        ancestors.push_back(*it);
        current = it->parent_id;
    }
    return ancestors;
}

std::vector<ContentBlock> descendants_of(const ContentBlock& block,
                                         const std::vector<ContentBlock>& blocks) {
    std::vector<ContentBlock> result;
    std::unordered_set<Uuid> seen{block.id.uuid()};
    std::deque<NuttyId> frontier{block.id};

    while (!frontier.empty()) {
        const auto parent = frontier.front();
        frontier.pop_front();

        for (auto& child : children_of(parent, blocks)) {
            if (!seen.insert(child.id.uuid()).second) continue;
            frontier.push_back(child.id);
            result.push_back(std::move(child));
        }
    }
    return result;
}

std::vector<ContentBlock> flatten_tree(const std::vector<ContentBlock>& blocks) {
    std::vector<ContentBlock> result;
    std::unordered_set<Uuid> path;

    std::function<void(const std::optional<NuttyId>&)> visit =
        [&](const std::optional<NuttyId>& parent_id) {
            for (auto& child : children_of(parent_id, blocks)) {
                const auto key = child.id.uuid();
                if (!path.insert(key).second) continue;

                const auto child_id = child.id;
                result.push_back(std::move(child));
                visit(child_id);
                path.erase(key);
            }
        };

    visit(std::nullopt);
    return result;
}

} // namespace nutty::blocks
