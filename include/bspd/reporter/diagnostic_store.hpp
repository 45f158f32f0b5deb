#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bsp/basic.hpp"

namespace bspd {

// Accumulated diagnostics per document for one compilation task.
//
// Each document owns an immutable revision of its diagnostic list. Updating
// builds a new revision and swaps it in with compare-and-swap, retrying if
// another thread updated first, so concurrent appends to one document are
// linearized in arrival order and appends to different documents never wait
// on each other. The map itself is only locked to find or insert a slot.
//
// Revisions of a document are numbered 1, 2, ... in the order they were
// installed. DeliverInOrder hands revisions to a consumer in that order, so
// the last list delivered for a document is always the newest one.
//
// Entries are never removed while the store is alive.
class DiagnosticStore {
 public:
  using DiagnosticSet = std::vector<bsp::Diagnostic>;
  using Snapshot = std::shared_ptr<const DiagnosticSet>;

  struct Revision {
    Snapshot diagnostics;
    // Position in the document's delivery order; 0 is the initial empty set
    std::size_t sequence = 0;
  };

  DiagnosticStore() = default;

  DiagnosticStore(const DiagnosticStore&) = delete;
  DiagnosticStore(DiagnosticStore&&) = delete;
  auto operator=(const DiagnosticStore&) -> DiagnosticStore& = delete;
  auto operator=(DiagnosticStore&&) -> DiagnosticStore& = delete;
  ~DiagnosticStore() = default;

  // Current set for the document, registering an empty one if absent.
  // Concurrent callers for an unseen document all observe the same set.
  auto Ensure(const bsp::TextDocumentIdentifier& document) -> Snapshot;

  // Appends one diagnostic and returns the revision holding the full set
  auto Append(
      const bsp::TextDocumentIdentifier& document, bsp::Diagnostic diagnostic)
      -> Revision;

  // Installs a new revision with the current set unchanged, registering an
  // empty set if absent. Used to republish a document.
  auto Revise(const bsp::TextDocumentIdentifier& document) -> Revision;

  // Calls deliver(revision.diagnostics) once every earlier revision of the
  // document has been delivered. No store lock is held while deliver runs.
  // Every revision returned by Append or Revise must be delivered exactly
  // once, or later revisions of the document wait forever.
  template <typename Deliver>
  auto DeliverInOrder(
      const bsp::TextDocumentIdentifier& document, const Revision& revision,
      Deliver&& deliver) -> void {
    Turn turn(GetOrCreateSlot(document), revision.sequence);
    std::forward<Deliver>(deliver)(revision.diagnostics);
  }

  // Current set, or nullptr if the document was never seen
  [[nodiscard]] auto Find(const bsp::TextDocumentIdentifier& document) const
      -> Snapshot;

  // Number of documents with a registered set
  [[nodiscard]] auto Size() const -> std::size_t;

 private:
  struct Slot {
    explicit Slot(std::shared_ptr<const Revision> initial)
        : current(std::move(initial)) {
    }

    std::atomic<std::shared_ptr<const Revision>> current;
    // Sequence of the last revision handed to a consumer
    std::atomic<std::size_t> delivered{0};
  };

  // Waits for the slot's previous revision to be delivered on construction,
  // marks its own revision delivered on destruction.
  class Turn {
   public:
    Turn(Slot& slot, std::size_t sequence);
    ~Turn();

    Turn(const Turn&) = delete;
    Turn(Turn&&) = delete;
    auto operator=(const Turn&) -> Turn& = delete;
    auto operator=(Turn&&) -> Turn& = delete;

   private:
    Slot& slot_;
    std::size_t sequence_;
  };

  auto GetOrCreateSlot(const bsp::TextDocumentIdentifier& document) -> Slot&;

  // Swaps in make_next(current) until no other thread interferes
  template <typename MakeNext>
  static auto Update(Slot& slot, MakeNext make_next) -> Revision {
    auto current = slot.current.load();
    std::shared_ptr<const Revision> next;
    do {
      next = std::make_shared<const Revision>(make_next(*current));
    } while (!slot.current.compare_exchange_weak(current, next));
    return *next;
  }

  mutable std::shared_mutex mutex_;

  // Slots are heap-allocated so references stay valid across rehashing
  std::unordered_map<bsp::TextDocumentIdentifier, std::unique_ptr<Slot>>
      slots_;
};

}  // namespace bspd
