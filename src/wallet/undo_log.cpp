// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/undo_log.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <string>

namespace lightwallet {
namespace wallet {

void UndoLog::Push(BlockUndo undo) {
  if (!records_.empty() && undo.height != records_.back().height + 1) {
    throw std::invalid_argument(
        "UndoLog::Push: height " + std::to_string(undo.height) +
        " does not follow " + std::to_string(records_.back().height));
  }
  records_.push_back(std::move(undo));
  Prune();
}

std::optional<BlockUndo> UndoLog::Pop() {
  if (records_.empty()) {
    return std::nullopt;
  }
  BlockUndo undo = std::move(records_.back());
  records_.pop_back();
  return undo;
}

const BlockUndo *UndoLog::Back() const {
  if (records_.empty()) {
    return nullptr;
  }
  return &records_.back();
}

void UndoLog::SetMaxDepth(size_t max_depth) {
  max_depth_ = max_depth;
  Prune();
}

void UndoLog::Prune() {
  if (max_depth_ == 0) {
    return;
  }
  while (records_.size() > max_depth_) {
    LOG_SYNC_TRACE("Pruning undo record for height {}",
                   records_.front().height);
    records_.pop_front();
  }
}

} // namespace wallet
} // namespace lightwallet
