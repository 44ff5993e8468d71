#include "model_slot.hpp"

#include "../logging.hpp"

#include <algorithm>
#include <format>

ModelSlot::ModelSlot(std::vector<ModelSpec> catalog, Factory factory, bool verbose)
    : catalog_(std::move(catalog)), factory_(std::move(factory)), verbose_(verbose) {}

const ModelSpec* ModelSlot::find(const std::string& model_id) const {
    auto it = std::ranges::find_if(catalog_, [&](const ModelSpec& s) { return s.id == model_id; });
    return it != catalog_.end() ? &*it : nullptr;
}

std::expected<ModelSlot::Lease, Error> ModelSlot::acquire(const std::string& model_id) {
    const ModelSpec* spec = find(model_id);
    if (!spec) {
        return std::unexpected(Error{ErrorKind::InvalidModel, "unknown model: " + model_id});
    }

    std::unique_lock lock(slot_mutex_);

    if (backend_ && backend_spec_ == spec) {
        return Lease(std::move(lock), backend_.get(), spec);
    }

    if (backend_) {
        log_info(verbose_, std::format("Evicting model {}", backend_spec_->id));
        backend_.reset();
        backend_spec_ = nullptr;
        set_resident(std::nullopt);
    }

    log_info(verbose_, std::format("Loading model {}", spec->id));
    auto backend = factory_(*spec);
    if (!backend) {
        return std::unexpected(Error{ErrorKind::BackendUnavailable,
                                     "no backend available for model: " + spec->id});
    }
    if (auto loaded = backend->load(); !loaded) {
        log_error("backend", std::format("loading {} failed: {}", spec->id, loaded.error().message));
        return std::unexpected(loaded.error());
    }

    backend_ = std::move(backend);
    backend_spec_ = spec;
    set_resident(spec->id);
    return Lease(std::move(lock), backend_.get(), spec);
}

void ModelSlot::evict() {
    std::lock_guard lock(slot_mutex_);
    backend_.reset();
    backend_spec_ = nullptr;
    set_resident(std::nullopt);
}

std::optional<std::string> ModelSlot::resident() const {
    std::lock_guard lock(state_mutex_);
    return resident_id_;
}

void ModelSlot::set_resident(std::optional<std::string> id) {
    std::lock_guard lock(state_mutex_);
    resident_id_ = std::move(id);
}
