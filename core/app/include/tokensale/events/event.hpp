#pragma once

#include "tokensale/events/sale_events.hpp"

#include <variant>

namespace tokensale {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus and the IPC publish socket.
// Adding a notification means adding it here; every std::visit over Event
// (stamping in UnitOfWork, JSON encoding) then has to handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SaleCreatedEvent,
    SaleUpdatedEvent,
    TokensBoughtEvent,
    OwnershipTransferredEvent,
    PaymentSettingsUpdatedEvent,
    ForeignAssetWithdrawnEvent,
    NativeWithdrawnEvent>;

}  // namespace tokensale
