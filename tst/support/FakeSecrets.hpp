// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Bastion a resilient provisioning engine.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef BASTION_TST_SUPPORT_FAKE_SECRETS_HPP
#define BASTION_TST_SUPPORT_FAKE_SECRETS_HPP

#include "secrets/SecretStore.hpp"
#include "common/Error.hpp"
#include <deque>
#include <expected>
#include <map>
#include <string>
#include <utility>

namespace bastion::test {

// In-memory key vault. Queued errors are returned, one per call, before any value.
class FakeSecretStore : public SecretStoreClient {
public:
    std::expected<std::string, Error> fetch(const std::string& name) override {
        ++fetches;
        if (!failures.empty()) {
            auto e = failures.front();
            failures.pop_front();
            return std::unexpected {e};
        }
        auto it = values.find(name);
        if (it == values.end()) {
            return std::unexpected {Error {ErrorCode::NotFound, "no secret " + name, name}};
        }
        return it->second;
    }

    std::expected<Unit, Error> store(const std::string& name, const std::string& value) override {
        ++stores;
        if (rejectStores) {
            return std::unexpected {Error {ErrorCode::Unauthorized, "write denied", name}};
        }
        values[name] = value;
        return Unit {};
    }

    void failNext(int n, const Error& e) {
        for (int i = 0; i < n; ++i) {
            failures.push_back(e);
        }
    }

    std::map<std::string, std::string> values;
    std::deque<Error> failures;
    bool rejectStores {false};
    int fetches {0};
    int stores {0};
};

class FakeSecretSource : public SecretSource {
public:
    std::expected<std::string, Error> get(const std::string& name) override {
        ++reads;
        auto it = values.find(name);
        if (it == values.end()) {
            return std::unexpected {Error {ErrorCode::NotFound, "no local secret " + name, name}};
        }
        return it->second;
    }

    std::map<std::string, std::string> values;
    int reads {0};
};

} // namespace bastion::test

#endif // BASTION_TST_SUPPORT_FAKE_SECRETS_HPP
