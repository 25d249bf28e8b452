#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sqlite3.h>
#include <zalodht/defs.h>

namespace zalodht {

/*
 * A transaction that is rolled back unless commit() succeeded. The importers
 * hold one per log line.
 */
class ZD_EXPORT xtransaction {
	public:
	constexpr xtransaction(sqlite3 *d = nullptr) : m_db(d) {}
	xtransaction(xtransaction &&o) noexcept : m_db(o.m_db) { o.m_db = nullptr; }
	~xtransaction();
	int commit();
	void operator=(xtransaction &&) = delete;
	operator bool() const { return m_db != nullptr; }

	private:
	sqlite3 *m_db = nullptr;
};

extern ZD_EXPORT int zd_sql_step(sqlite3_stmt *);

struct ZD_EXPORT xstmt {
	xstmt() = default;
	xstmt(xstmt &&o) noexcept : m_ptr(o.m_ptr) { o.m_ptr = nullptr; }
	~xstmt() {
		if (m_ptr != nullptr)
			sqlite3_finalize(m_ptr);
	}
	inline int bind_null(unsigned int col) { return sqlite3_bind_null(m_ptr, col); }
	inline int bind_int64(unsigned int col, int64_t v) { return sqlite3_bind_int64(m_ptr, col, v); }
	inline int bind_text(unsigned int col, const char *s) { return sqlite3_bind_text(m_ptr, col, s, -1, SQLITE_STATIC); }
	inline int bind_text(unsigned int col, const std::string &s) { return sqlite3_bind_text(m_ptr, col, s.c_str(), s.size(), SQLITE_STATIC); }
	inline int bind_blob(unsigned int col, const void *d, size_t z) { return sqlite3_bind_blob64(m_ptr, col, d, z, SQLITE_STATIC); }
	inline const char *col_text(unsigned int col) { return reinterpret_cast<const char *>(sqlite3_column_text(m_ptr, col)); }
	inline int64_t col_int64(unsigned int col) { return sqlite3_column_int64(m_ptr, col); }
	inline int step() { return zd_sql_step(m_ptr); }
	inline int reset() { sqlite3_clear_bindings(m_ptr); return sqlite3_reset(m_ptr); }
	inline void finalize() { *this = nullptr; }
	void operator=(std::nullptr_t) {
		if (m_ptr != nullptr)
			sqlite3_finalize(m_ptr);
		m_ptr = nullptr;
	}
	void operator=(xstmt &&o) noexcept {
		if (m_ptr != nullptr)
			sqlite3_finalize(m_ptr);
		m_ptr = o.m_ptr;
		o.m_ptr = nullptr;
	}
	operator sqlite3_stmt *() { return m_ptr; }
	sqlite3_stmt *m_ptr = nullptr;
};

enum {
	/* a failure is expected and handled by the caller */
	SQLEXEC_SILENT_ERROR = 0x1U,
};

struct sqlite_delete {
	inline void operator()(sqlite3 *d) const { sqlite3_close_v2(d); }
};

struct sqlite_free {
	inline void operator()(void *p) const { sqlite3_free(p); }
};

extern ZD_EXPORT xstmt zd_sql_prep(sqlite3 *, const char *, unsigned int flags = 0);
/* BEGIN IMMEDIATE; a falsy xtransaction if the write lock is unavailable */
extern ZD_EXPORT xtransaction zd_sql_begin(sqlite3 *);
extern ZD_EXPORT int zd_sql_exec(sqlite3 *, const char *query, unsigned int flags = 0);

extern ZD_EXPORT unsigned int zd_sqlite_debug;

}
