#include "fluxconf/MigrationStep.hpp"
#include "fluxconf/Errors.hpp"

namespace fluxconf {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

MigrationStep::MigrationStep(TransformFn fn)
    : body_(std::move(fn))
{
    if (!std::get<TransformFn>(body_)) {
        throw ConfigError("Migration transform must be callable");
    }
}

MigrationStep::MigrationStep(Patch patch)
    : body_(std::move(patch))
{}

MigrationStep MigrationStep::from_document(const Value& patch_document) {
    return MigrationStep(parse_patch(patch_document));
}

MigrationStep::Kind MigrationStep::kind() const noexcept {
    return std::holds_alternative<TransformFn>(body_) ? Kind::Transform : Kind::Patch;
}

const Patch* MigrationStep::patch() const noexcept {
    return std::get_if<Patch>(&body_);
}

Document MigrationStep::apply(Document document) const {
    return std::visit(overloaded{
        [&document](const TransformFn& fn) {
            return fn(std::move(document));
        },
        [&document](const Patch& patch) {
            return apply_patch(document, patch);
        }
    }, body_);
}

std::string to_string(MigrationStep::Kind kind) {
    switch (kind) {
        case MigrationStep::Kind::Transform: return "transform";
        case MigrationStep::Kind::Patch: return "patch";
    }
    return "unknown";
}

} // namespace fluxconf
