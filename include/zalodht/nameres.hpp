#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <zalodht/database.h>
#include <zalodht/defs.h>

namespace zalodht {

enum class conv_kind { dm, group };

/*
 * Zalo ids are decimal strings; group ids carry a leading 'g'. Everything
 * downstream works with the parsed form.
 */
struct ZD_EXPORT conv_id {
	conv_kind kind = conv_kind::dm;
	int64_t id = 0;

	static conv_id parse(const std::string_view &);
	inline bool is_group() const { return kind == conv_kind::group; }
	inline const char *kind_str() const { return is_group() ? "GROUP" : "DM"; }
	std::string placeholder() const;
};

extern ZD_EXPORT bool is_placeholder_name(const std::string_view &);

class ZD_EXPORT name_resolver {
	public:
	virtual ~name_resolver() = default;
	/* A miss is std::nullopt, not an error. */
	virtual std::optional<std::string> lookup(const conv_id &) = 0;
};

class ZD_EXPORT null_resolver final : public name_resolver {
	public:
	std::optional<std::string> lookup(const conv_id &) override { return std::nullopt; }
};

/*
 * Contacts index of the Zalo PC client (Index.db). The passphrase goes to
 * SQLCipher through PRAGMA key; the cipher's own KDF applies.
 */
class ZD_EXPORT index_resolver final : public name_resolver {
	public:
	index_resolver() = default;
	NOMOVE(index_resolver);
	void open(const char *path, const std::string_view &passphrase, const char *cipher_compat = nullptr);
	std::optional<std::string> lookup(const conv_id &) override;

	private:
	std::optional<std::string> first_row(xstmt &, const conv_id &);

	std::unique_ptr<sqlite3, sqlite_delete> m_db;
	xstmt m_group, m_friend, m_friends_info;
};

/* whether @db is driven by SQLCipher rather than stock sqlite */
extern ZD_EXPORT bool zd_sql_has_cipher(sqlite3 *);
extern ZD_EXPORT std::string display_name(name_resolver &, const conv_id &, const std::string_view &given = {});

}
