/* ===================================================================== *
 *  include/snclass/ModelRegistry.hpp  ––  built-in + uploaded models
 * ===================================================================== */
#pragma once
#include "ModelDescriptor.hpp"

#include <ankerl/unordered_dense.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snclass {

/*
 * Built-in models are installed during startup, before the registry is
 * shared.  User models live in an immutable snapshot that is replaced as
 * a whole on every upload:
 *
 *   • readers load the current snapshot pointer (lock-free) and keep it
 *     for the rest of their request;
 *   • writers serialise on write_mtx_, copy, insert, publish.
 */
class ModelRegistry {
public:
    struct Snapshot {
        ankerl::unordered_dense::map<std::string, ModelPtr> models;
    };
    using SnapshotPtr = std::shared_ptr<const Snapshot>;

    ModelRegistry();
    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    /* ------------ built-ins (startup only) ------------------------- */
    void     set_builtin(ModelDescriptor d, InferenceBackend backend);
    ModelPtr builtin(ModelKind kind) const;          // NotFoundError if absent
    bool     has_builtin(ModelKind kind) const;

    /* ------------ user models -------------------------------------- */
    // ValidationError on a bad descriptor, ConflictError on a duplicate id
    ModelPtr register_user(ModelDescriptor d, InferenceBackend backend);
    ModelPtr user(const std::string& id) const;      // NotFoundError if absent

    SnapshotPtr              snapshot() const { return users_.load(); }
    std::vector<std::string> user_ids() const;       // sorted

private:
    ModelPtr builtin_cnn_;
    ModelPtr builtin_transformer_;

    std::atomic<SnapshotPtr> users_;
    std::mutex               write_mtx_;
};

} // namespace snclass
