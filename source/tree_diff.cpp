// tree_diff.cpp - PatchCollector and difference checks

#include <driftgate/tree_diff.h>

namespace driftgate {

// ============================================================
// PatchCollector Implementation
// ============================================================

void PatchCollector::diff(const Value& current, const Value& desired)
{
    patch_.clear();

    // Same Value object compared with itself
    if (&current.data == &desired.data) {
        return;
    }

    Path root_path;
    root_path.reserve(16);
    diff_value(current, desired, root_path);
}

Patch PatchCollector::take_patch()
{
    Patch result = std::move(patch_);
    patch_.clear();
    return result;
}

void PatchCollector::clear()
{
    patch_.clear();
}

void PatchCollector::diff_value(const Value& current, const Value& desired, Path& current_path)
{
    if (current.kind() != desired.kind()) [[unlikely]] {
        patch_.push_back(PatchOperation::replace(current_path, desired));
        return;
    }

    std::visit([&](const auto& current_arg) {
        using T = std::decay_t<decltype(current_arg)>;

        if constexpr (std::is_same_v<T, ValueMap>) {
            const auto& desired_map = std::get<ValueMap>(desired.data);
            // immer identity check: same root, nothing below can differ
            if (current_arg.impl().root == desired_map.impl().root &&
                current_arg.impl().size == desired_map.impl().size) {
                return;
            }
            diff_map(current_arg, desired_map, current_path);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            diff_vector(current_arg, std::get<ValueVector>(desired.data), desired, current_path);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null
        }
        else {
            // Same kind scalars; int64_t/double mix handled by operator==
            if (!(current == desired)) {
                patch_.push_back(PatchOperation::replace(current_path, desired));
            }
        }
    }, current.data);
}

void PatchCollector::diff_map(const ValueMap& current, const ValueMap& desired, Path& current_path)
{
    const auto current_keys = detail::sorted_keys(current);
    const auto desired_keys = detail::sorted_keys(desired);

    // Removals first, in key order
    for (const auto& key : current_keys) {
        if (!desired.find(key)) {
            current_path.push_back(key);
            patch_.push_back(PatchOperation::remove(current_path));
            current_path.pop_back();
        }
    }

    // Then one ordered pass over desired: adds and shared keys
    for (const auto& key : desired_keys) {
        const ValueBox& desired_box = *desired.find(key);
        current_path.push_back(key);
        if (const ValueBox* current_box = current.find(key)) {
            // Shared box, unchanged subtree
            if (&current_box->get() != &desired_box.get()) {
                diff_value(current_box->get(), desired_box.get(), current_path);
            }
        } else {
            patch_.push_back(PatchOperation::add(current_path, desired_box.get()));
        }
        current_path.pop_back();
    }
}

void PatchCollector::diff_vector(const ValueVector& current, const ValueVector& desired,
                                 const Value& desired_val, Path& current_path)
{
    // Sequences are atomic: one replace for the whole sequence, never per element
    if (!(current == desired)) {
        patch_.push_back(PatchOperation::replace(current_path, desired_val));
    }
}

// ============================================================
// Convenience functions
// ============================================================

Patch make_patch(const Value& current, const Value& desired)
{
    PatchCollector collector;
    collector.diff(current, desired);
    return collector.take_patch();
}

bool has_any_difference(const Value& current, const Value& desired)
{
    return !(current == desired);
}

} // namespace driftgate
