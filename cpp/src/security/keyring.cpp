#include "zff/security/keyring.hpp"

namespace zff::security {

    KeyMaterial key_from_password(const std::string& password) {
        KeyMaterial m;
        m.password = password;
        return m;
    }

    KeyMaterial key_from_raw(const Key256& key) noexcept {
        KeyMaterial m;
        m.has_raw_key = true;
        m.raw_key = key;
        return m;
    }

    const KeyMaterial* KeyRing::lookup(u64 object_id) const noexcept {
        const auto it = per_object_.find(object_id);
        if (it != per_object_.end() && !it->second.empty()) {
            return &it->second;
        }
        if (!default_.empty()) {
            return &default_;
        }
        return nullptr;
    }

} // namespace zff::security
