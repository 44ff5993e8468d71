#pragma once

#include "backend.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Single-slot pool: at most one model backend is resident at a time.
// Acquiring a different model evicts the current one before loading the new
// one. A Lease holds the slot exclusively until it goes out of scope, so
// requests for different models serialize here.
class ModelSlot {
public:
    using Factory = std::function<std::unique_ptr<ModelBackend>(const ModelSpec&)>;

    class Lease {
    public:
        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) noexcept = default;

        ModelBackend& backend() const { return *backend_; }
        const ModelSpec& spec() const { return *spec_; }

    private:
        friend class ModelSlot;
        Lease(std::unique_lock<std::mutex> lock, ModelBackend* backend, const ModelSpec* spec)
            : lock_(std::move(lock)), backend_(backend), spec_(spec) {}

        std::unique_lock<std::mutex> lock_;
        ModelBackend* backend_;
        const ModelSpec* spec_;
    };

    ModelSlot(std::vector<ModelSpec> catalog, Factory factory, bool verbose = false);

    ModelSlot(const ModelSlot&) = delete;
    ModelSlot& operator=(const ModelSlot&) = delete;

    // InvalidModel for an unknown id, BackendUnavailable if loading fails.
    std::expected<Lease, Error> acquire(const std::string& model_id);

    // Drops the resident backend, waiting for any outstanding lease.
    void evict();

    std::optional<std::string> resident() const;
    const std::vector<ModelSpec>& catalog() const { return catalog_; }
    const ModelSpec* find(const std::string& model_id) const;

private:
    void set_resident(std::optional<std::string> id);

    std::vector<ModelSpec> catalog_;
    Factory factory_;
    bool verbose_;

    std::mutex slot_mutex_; // held by the active lease
    std::unique_ptr<ModelBackend> backend_;
    const ModelSpec* backend_spec_ = nullptr;

    mutable std::mutex state_mutex_;
    std::optional<std::string> resident_id_;
};
