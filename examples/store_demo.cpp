/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <iostream>
#include <string>
#include <vector>
#include "../src/store/fragment.h"
#include "../src/store/store_error.h"
#include "../src/store/store_runtime.h"
#include "../src/util/log.h"

using namespace flashkv;
using namespace flashkv::store;
using namespace std;

static string show(const optional<vector<uint8_t>>& value) {
    if (!value) {
        return "<absent>";
    }
    return "\"" + string(value->begin(), value->end()) + "\"";
}

int main(int argc, char** argv) {
    initLoggingFromEnv();

    StoreRuntime::Config config = StoreRuntime::Config::from_env();
    if (argc > 1) {
        config.storage_path = argv[1];
    }
    if (config.storage_path.empty()) {
        config.storage_path = "flashkv.img";
    }

    try {
        auto runtime = StoreRuntime::boot(config);
        Store& store = runtime->store();

        cout << "=== flashkv store demo ===\n\n";
        cout << "Image: " << config.storage_path << ", capacity " << store.capacity()
             << " bytes, " << store.used() << " used, max value " << store.max_value_length() << "\n";

        const vector<uint8_t> hello = {'h', 'e', 'l', 'l', 'o'};
        store.insert(0, hello);
        cout << "insert(0, \"hello\") -> find(0) = " << show(store.find(0)) << "\n";

        store.remove(0);
        cout << "remove(0)          -> find(0) = " << show(store.find(0)) << "\n\n";

        // A value longer than one entry goes over keys 0..2
        fragment::KeyRange range{0, 3};
        vector<uint8_t> large(1500);
        for (size_t i = 0; i < large.size(); i++) {
            large[i] = static_cast<uint8_t>('a' + i % 26);
        }
        fragment::write(store, range, large);
        auto back = fragment::read(store, range);
        cout << "fragment over keys 0..2: wrote " << large.size() << " bytes, read "
             << (back ? back->size() : 0) << " bytes, "
             << (back && *back == large ? "match" : "MISMATCH") << "\n";
        fragment::remove(store, range);
        cout << "fragment removed, keys left: " << store.keys().size() << "\n\n";

        cout << "Metrics: " << store.metrics().summary() << "\n";
    } catch (const StoreError& e) {
        cerr << "store error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
