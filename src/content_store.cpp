#include "vellum/content_store.hpp"

#include <algorithm>
#include <exception>

#include "vellum/observability.hpp"

namespace vellum {

namespace {

std::vector<Block>::iterator find_block(std::vector<Block>& blocks, const std::string& id) {
  return std::find_if(blocks.begin(), blocks.end(), [&](const Block& b) { return b.id == id; });
}

}  // namespace

InMemoryContentStore::InMemoryContentStore(std::vector<Block> initial)
    : blocks_(std::move(initial)) {}

std::vector<Block> InMemoryContentStore::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return blocks_;
}

uint64_t InMemoryContentStore::version() const {
  std::lock_guard<std::mutex> lk(mu_);
  return version_;
}

uint64_t InMemoryContentStore::subscribe(ContentListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void InMemoryContentStore::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& l) { return l.first == id; }),
                   listeners_.end());
}

void InMemoryContentStore::transact(const std::function<void(std::vector<Block>&)>& fn) {
  uint64_t committed = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Block> working = blocks_;
    fn(working);
    blocks_.swap(working);
    committed = ++version_;
  }
  notify(committed);
}

bool InMemoryContentStore::insert(Block block, size_t index) {
  if (block.id.empty()) return false;
  bool inserted = false;
  transact([&](std::vector<Block>& blocks) {
    if (find_block(blocks, block.id) != blocks.end()) return;
    const size_t at = std::min(index, blocks.size());
    blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(at), std::move(block));
    inserted = true;
  });
  return inserted;
}

bool InMemoryContentStore::append(Block block) {
  return insert(std::move(block), static_cast<size_t>(-1));
}

bool InMemoryContentStore::update_payload(const std::string& block_id,
                                          const std::string& payload) {
  bool found = false;
  transact([&](std::vector<Block>& blocks) {
    auto it = find_block(blocks, block_id);
    if (it == blocks.end()) return;
    it->payload = payload;
    found = true;
  });
  return found;
}

bool InMemoryContentStore::remove(const std::string& block_id) {
  bool found = false;
  transact([&](std::vector<Block>& blocks) {
    auto it = find_block(blocks, block_id);
    if (it == blocks.end()) return;
    blocks.erase(it);
    found = true;
  });
  return found;
}

bool InMemoryContentStore::move(const std::string& block_id, size_t new_index) {
  bool found = false;
  transact([&](std::vector<Block>& blocks) {
    auto it = find_block(blocks, block_id);
    if (it == blocks.end()) return;
    Block b = std::move(*it);
    blocks.erase(it);
    const size_t at = std::min(new_index, blocks.size());
    blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(at), std::move(b));
    found = true;
  });
  return found;
}

void InMemoryContentStore::replace_all(std::vector<Block> blocks) {
  transact([&](std::vector<Block>& current) { current = std::move(blocks); });
}

void InMemoryContentStore::apply_snapshot(std::vector<Block> blocks) {
  replace_all(std::move(blocks));
}

void InMemoryContentStore::notify(uint64_t version) const {
  std::vector<ContentListener> targets;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    targets.reserve(listeners_.size());
    for (const auto& l : listeners_) targets.push_back(l.second);
  }
  for (const auto& fn : targets) {
    try {
      fn(version);
    } catch (const std::exception& e) {
      log_event(LogLevel::error, "content_store", "listener_failed", e.what());
    }
  }
}

}  // namespace vellum
