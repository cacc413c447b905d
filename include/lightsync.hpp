#pragma once

/*
===============================================================================
LightSync - Public API Entry Point
===============================================================================

LightSync keeps a local, sequence-checked mirror of a venue's order books,
user orders and balances, and price histories over one WebSocket session.

lightsync::Client is the user-facing facade. The building blocks it is made
of (stores, router, registry, connection FSM) live in lightsync::core and can
be driven directly with any transport that satisfies
core::transport::WebSocketConcept.
===============================================================================
*/

#include <lightsync/client.hpp>
