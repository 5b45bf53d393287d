// Configure-time check: exits 0 when the linked SQLite was built with FTS5
#include <sqlite3.h>
int main() {
    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK)
        return 1;
    int rc = sqlite3_exec(db, "CREATE VIRTUAL TABLE fts5_check USING fts5(body)", nullptr, nullptr,
                          nullptr);
    sqlite3_close(db);
    return rc == SQLITE_OK ? 0 : 1;
}
