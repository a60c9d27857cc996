#pragma once

namespace lw::db {

struct Schema {
    // Idempotent; safe to run on every start.
    static void initTablesIfNotExists();
};

}
