// patch.cpp - Patch op codes and document conversion

#include <driftgate/patch.h>
#include <driftgate/builders.h>
#include <driftgate/errors.h>
#include <driftgate/json_pointer.h>

namespace driftgate {

namespace {

[[noreturn]] void reject(std::size_t index, const std::string& what)
{
    throw ValidationError("patch operation " + std::to_string(index) + ": " + what);
}

PatchOperation operation_from_value(const Value& element, std::size_t index)
{
    if (!element.is_map()) {
        reject(index, "expected a mapping, got " + std::string{kind_name(element.kind())});
    }

    if (!element.contains("op")) {
        reject(index, "missing \"op\"");
    }
    const Value op_val = element.at("op");
    if (!op_val.is_string()) {
        reject(index, "\"op\" must be a string");
    }

    PatchOp op;
    try {
        op = parse_op(op_val.as_string_view());
    } catch (const ValidationError& e) {
        reject(index, e.what());
    }

    if (!element.contains("path")) {
        reject(index, "missing \"path\"");
    }
    const Value path_val = element.at("path");
    if (!path_val.is_string()) {
        reject(index, "\"path\" must be a string");
    }
    if (!is_valid_pointer(path_val.as_string_view())) {
        reject(index, "\"path\" must start with '/': " + path_val.as_string());
    }

    PatchOperation operation;
    operation.op = op;
    operation.path = parse_pointer(path_val.as_string_view());

    if (op != PatchOp::Remove) {
        if (!element.contains("value")) {
            reject(index, "missing \"value\" for " + std::string{op_name(op)});
        }
        operation.value = element.at("value");
    }
    return operation;
}

} // anonymous namespace

std::string_view op_name(PatchOp op) noexcept
{
    switch (op) {
        case PatchOp::Add:     return "add";
        case PatchOp::Remove:  return "remove";
        case PatchOp::Replace: return "replace";
    }
    return "unknown";
}

PatchOp parse_op(std::string_view name)
{
    if (name == "add") return PatchOp::Add;
    if (name == "remove") return PatchOp::Remove;
    if (name == "replace") return PatchOp::Replace;
    throw ValidationError("unknown op \"" + std::string{name} + "\"");
}

Value operation_to_value(const PatchOperation& operation)
{
    MapBuilder builder;
    builder.set("op", std::string{op_name(operation.op)})
           .set("path", path_to_pointer(operation.path));
    if (operation.value) {
        builder.set("value", *operation.value);
    }
    return builder.finish();
}

Value patch_to_value(const Patch& patch)
{
    VectorBuilder builder;
    for (const auto& operation : patch) {
        builder.push_back(operation_to_value(operation));
    }
    return builder.finish();
}

Patch patch_from_value(const Value& document)
{
    if (!document.is_vector()) {
        throw ValidationError("patch document must be a sequence, got " +
                              std::string{kind_name(document.kind())});
    }

    Patch patch;
    patch.reserve(document.size());
    std::size_t index = 0;
    for (const auto& box : document.as_vector()) {
        patch.push_back(operation_from_value(*box, index));
        ++index;
    }
    return patch;
}

} // namespace driftgate
