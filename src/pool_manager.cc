#include "pool_manager.h"

#include <glog/logging.h>
#include <memory>
#include <sstream>

namespace sandboxd {

std::ostream& operator<<(std::ostream& out, const PoolKey& key) {
  out << SandboxTypeName(key.type);
  if (!key.language.empty()) {
    out << "/" << key.language;
  }
  return out;
}

PoolManager::PoolManager(SandboxController& controller,
                         BackgroundQueue& background,
                         std::size_t target_size)
    : controller_(controller),
      background_(background),
      target_size_(target_size) {}

void PoolManager::AddPool(const PoolKey& key) {
  pools_[key];
}

std::vector<PoolKey> PoolManager::keys() const {
  std::vector<PoolKey> keys;
  for (const auto& pool : pools_) {
    keys.push_back(pool.first);
  }
  return keys;
}

std::size_t PoolManager::ready_count(const PoolKey& key) const {
  auto iter = pools_.find(key);
  return iter == pools_.end() ? 0 : iter->second.ready.size();
}

std::size_t PoolManager::in_flight_count(const PoolKey& key) const {
  auto iter = pools_.find(key);
  return iter == pools_.end() ? 0 : iter->second.in_flight;
}

void PoolManager::Initialize(Callback done) {
  LOG(INFO) << "Pre-warming " << pools_.size() << " pools of " << target_size_;
  FillAll(std::make_shared<std::vector<PoolKey>>(keys()), 0, std::move(done));
}

void PoolManager::FillAll(std::shared_ptr<std::vector<PoolKey>> keys,
                          std::size_t index,
                          Callback done) {
  if (index == keys->size()) {
    done();
    return;
  }
  const PoolKey& key = (*keys)[index];
  Fill(key, [this, keys, index, done](const Status& status) {
    if (!status.ok()) {
      LOG(WARNING) << "Failed to pre-warm " << (*keys)[index] << ": " << status;
    }
    FillAll(keys, index + 1, done);
  });
}

void PoolManager::Fill(const PoolKey& key, StatusHandler done) {
  auto iter = pools_.find(key);
  if (draining_ || iter == pools_.end() ||
      iter->second.ready.size() + iter->second.in_flight >= target_size_) {
    done(Status());
    return;
  }
  ++iter->second.in_flight;
  SandboxOptions options;
  options.language = key.language;
  options.prewarmed = true;
  controller_.CreateSandbox(key.type, std::string(), options, [this, key, done](
      const Status& status, SandboxHandle handle) {
    Pool& pool = pools_[key];
    --pool.in_flight;
    if (!status.ok()) {
      done(status);
      return;
    }
    if (draining_) {
      controller_.DestroySandbox(handle, done);
      return;
    }
    pool.ready.push_back(std::move(handle));
    VLOG(1) << "Pre-warmed " << key << " sandbox (" << pool.ready.size() << "/"
            << target_size_ << ")";
    Fill(key, done);
  });
}

void PoolManager::Replenish(const PoolKey& key) {
  std::ostringstream name;
  name << "replenish " << key;
  background_.Submit(name.str(), [this, key](StatusHandler done) {
    Fill(key, done);
  });
}

Optional<SandboxHandle> PoolManager::Acquire(const PoolKey& key) {
  auto iter = pools_.find(key);
  if (draining_ || iter == pools_.end() || iter->second.ready.empty()) {
    return boost::none;
  }
  SandboxHandle handle = std::move(iter->second.ready.front());
  iter->second.ready.pop_front();
  Replenish(key);
  return handle;
}

void PoolManager::Evict(const PoolKey& key, const std::string& id) {
  std::deque<SandboxHandle>& ready = pools_[key].ready;
  for (auto entry = ready.begin(); entry != ready.end(); ++entry) {
    if (entry->id != id) {
      continue;
    }
    SandboxHandle handle = std::move(*entry);
    ready.erase(entry);
    LOG(WARNING) << "Evicting pooled " << key << " sandbox " << id.substr(0, 12);
    background_.Submit("remove " + id, [this, handle](StatusHandler done) {
      controller_.DestroySandbox(handle, done);
    });
    return;
  }
}

void PoolManager::Maintain(Callback done) {
  std::vector<std::pair<PoolKey, SandboxHandle>> entries;
  for (const auto& pool : pools_) {
    for (const SandboxHandle& handle : pool.second.ready) {
      entries.emplace_back(pool.first, handle);
    }
  }
  auto refill = [this, done]() {
    FillAll(std::make_shared<std::vector<PoolKey>>(keys()), 0, done);
  };
  if (entries.empty()) {
    refill();
    return;
  }
  auto pending = std::make_shared<std::size_t>(entries.size());
  for (const auto& entry : entries) {
    PoolKey key = entry.first;
    std::string id = entry.second.id;
    controller_.CheckRunning(entry.second, [this, key, id, pending, refill](
        const Status& status, bool running) {
      if (!status.ok() || !running) {
        Evict(key, id);
      }
      if (--*pending == 0) {
        refill();
      }
    });
  }
}

void PoolManager::Drain(Callback done) {
  draining_ = true;
  std::vector<SandboxHandle> handles;
  for (auto& pool : pools_) {
    for (SandboxHandle& handle : pool.second.ready) {
      handles.push_back(std::move(handle));
    }
    pool.second.ready.clear();
  }
  if (handles.empty()) {
    done();
    return;
  }
  auto pending = std::make_shared<std::size_t>(handles.size());
  for (const SandboxHandle& handle : handles) {
    std::string id = handle.id;
    controller_.DestroySandbox(handle, [id, pending, done](const Status& status) {
      if (!status.ok()) {
        LOG(WARNING) << "Failed to destroy pooled sandbox " << id << ": "
                     << status;
      }
      if (--*pending == 0) {
        done();
      }
    });
  }
}

}
