#pragma once

#include <map>
#include <string>

#include "zff/core/errors.hpp"
#include "zff/core/types.hpp"
#include "zff/security/crypto.hpp"
#include "zff/security/kdf.hpp"

namespace zff::security {

    // What the caller knows about an encrypted object: a password (run
    // through the kdf stored in the header) or the raw 32 byte master key.
    struct KeyMaterial {
        bool has_raw_key{false};
        Key256 raw_key{};
        std::string password;

        [[nodiscard]] bool empty() const noexcept { return !has_raw_key && password.empty(); }
    };

    [[nodiscard]] KeyMaterial key_from_password(const std::string& password);
    [[nodiscard]] KeyMaterial key_from_raw(const Key256& key) noexcept;

    class KeyRing {
    public:
        void set_default(const KeyMaterial& m) { default_ = m; }
        void set_for_object(u64 object_id, const KeyMaterial& m) { per_object_[object_id] = m; }

        // Per object entry first, then the default; nullptr if neither is set.
        [[nodiscard]] const KeyMaterial* lookup(u64 object_id) const noexcept;

    private:
        KeyMaterial default_;
        std::map<u64, KeyMaterial> per_object_;
    };

} // namespace zff::security
