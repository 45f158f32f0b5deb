#include "bspd/reporter/diagnostic_store.hpp"

#include <mutex>

namespace bspd {

DiagnosticStore::Turn::Turn(Slot& slot, std::size_t sequence)
    : slot_(slot), sequence_(sequence) {
  auto delivered = slot_.delivered.load();
  while (delivered + 1 < sequence_) {
    slot_.delivered.wait(delivered);
    delivered = slot_.delivered.load();
  }
}

DiagnosticStore::Turn::~Turn() {
  slot_.delivered.store(sequence_);
  slot_.delivered.notify_all();
}

auto DiagnosticStore::Ensure(const bsp::TextDocumentIdentifier& document)
    -> Snapshot {
  return GetOrCreateSlot(document).current.load()->diagnostics;
}

auto DiagnosticStore::Append(
    const bsp::TextDocumentIdentifier& document, bsp::Diagnostic diagnostic)
    -> Revision {
  return Update(GetOrCreateSlot(document), [&](const Revision& current) {
    auto updated = std::make_shared<DiagnosticSet>();
    updated->reserve(current.diagnostics->size() + 1);
    updated->insert(
        updated->end(), current.diagnostics->begin(),
        current.diagnostics->end());
    updated->push_back(diagnostic);
    return Revision{
        .diagnostics = std::move(updated),
        .sequence = current.sequence + 1,
    };
  });
}

auto DiagnosticStore::Revise(const bsp::TextDocumentIdentifier& document)
    -> Revision {
  return Update(GetOrCreateSlot(document), [](const Revision& current) {
    return Revision{
        .diagnostics = current.diagnostics,
        .sequence = current.sequence + 1,
    };
  });
}

auto DiagnosticStore::Find(const bsp::TextDocumentIdentifier& document) const
    -> Snapshot {
  std::shared_lock lock(mutex_);
  auto it = slots_.find(document);
  if (it == slots_.end()) {
    return nullptr;
  }
  return it->second->current.load()->diagnostics;
}

auto DiagnosticStore::Size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return slots_.size();
}

auto DiagnosticStore::GetOrCreateSlot(
    const bsp::TextDocumentIdentifier& document) -> Slot& {
  {
    std::shared_lock lock(mutex_);
    if (auto it = slots_.find(document); it != slots_.end()) {
      return *it->second;
    }
  }

  // Allocate before touching the map so a throw leaves it unchanged
  auto slot = std::make_unique<Slot>(std::make_shared<const Revision>(Revision{
      .diagnostics = std::make_shared<const DiagnosticSet>(),
  }));

  std::unique_lock lock(mutex_);
  // try_emplace leaves an existing slot untouched if another thread won
  auto it = slots_.try_emplace(document, std::move(slot)).first;
  return *it->second;
}

}  // namespace bspd
