#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/shorturl.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//    #include "shorturl/shorturl.h"
//    using namespace shorturl;
//
//    store::JsonFileStore store("./public/data.json");
//    registry::Registry urls(store);
//    dns::Resolver probe;
//    auto app = api::createApp(urls, probe);
//    app.listen(3000);
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "console.h"

#include "entry.h"
#include "validator.h"
#include "dns.h"
#include "store.h"
#include "registry.h"

#include "http.h"
#include "middleware.h"
#include "api.h"
#include "config.h"
#include "lifecycle.h"
