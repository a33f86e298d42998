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

#include "store_runtime.h"
#include "store_error.h"
#include "unsupported_storage.h"
#include "../util/log.h"

namespace flashkv {
namespace store {

std::unique_ptr<StoreRuntime> StoreRuntime::boot(const Config& config) {
    std::unique_ptr<StoreRuntime> rt(new StoreRuntime(config));

    if (!config.log_dir.empty()) {
        rt->log_manager_.reset(new LogManager(config.log_dir));
    }

    if (config.storage_path.empty()) {
        rt->storage_.reset(new UnsupportedStorage());
        warning() << "runtime: no storage path, booting without a store";
        return rt;
    }

    rt->storage_.reset(new FileStorage(config.storage_path, config.storage));
    rt->store_ = Store::open(*rt->storage_, config.store);
    info() << "runtime: store ready on " << config.storage_path;
    return rt;
}

StoreRuntime::~StoreRuntime() {
    store_.reset();
    storage_.reset();
    log_manager_.reset();
}

Store& StoreRuntime::store() {
    if (!store_) {
        throw StoreError(StoreErrorCode::InvalidArgument, "runtime has no store");
    }
    return *store_;
}

} // namespace store
} // namespace flashkv
