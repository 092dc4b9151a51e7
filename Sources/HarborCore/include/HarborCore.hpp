#pragma once

// HarborCore - offline resilience for point-of-sale clients
//
// Usage:
//   #include <HarborCore.hpp>
//
//   harbor::configuration config("pos.db",
//                                "http://pos.local/web/webclient/version_info",
//                                "http://pos.local/pos/offline/batch");
//   harbor::offline_core core(config);
//   core.start();
//
//   // Checkout while the backend is down - queued durably, pushed later
//   core.queue().enqueue({{"order_id", "Order 00042"}, {"amount_total", 12.5}}, "pos.order");
//
//   // Keep what the UI needs to come back up offline
//   core.sessions().open_session("cashier-7");
//   core.sessions().load_reference_data("product.product", products_json);
//   core.sessions().snapshot();

#include "harbor/types.hpp"
#include "harbor/log.hpp"
#include "harbor/db.hpp"
#include "harbor/schema.hpp"
#include "harbor/store.hpp"
#include "harbor/retry.hpp"
#include "harbor/queue.hpp"
#include "harbor/scheduler.hpp"
#include "harbor/network.hpp"
#include "harbor/connection_monitor.hpp"
#include "harbor/sync.hpp"
#include "harbor/reference_data.hpp"
#include "harbor/snapshot_notifier.hpp"
#include "harbor/session.hpp"
#include "harbor/offline_cache.hpp"
#include "harbor/harbor.hpp"
