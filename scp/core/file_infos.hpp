#ifndef SP_SCP_FILE_INFOS_HEADER
#define SP_SCP_FILE_INFOS_HEADER

#include "errors.hpp"
#include "response.hpp"

namespace securepath::scp {

/** \brief Metadata of one file as exchanged in the permission and time directives
 *
 *  Empty strings and zero values mean the field is not known.
 */
struct file_infos {
	/// directive line the record was parsed from
	std::string raw_message;
	/// name of the file without path, spaces in the name are not escaped by the protocol
	std::string filename;
	/// octal mode as transmitted, e.g. "0644"
	std::string permissions;
	/// file size in bytes
	std::uint64_t size{};
	/// access time in seconds from Jan 1, 1970 UTC
	unix_time access_time{};
	/// modification time in seconds from Jan 1, 1970 UTC
	unix_time modify_time{};

	bool has_times() const { return access_time != 0 || modify_time != 0; }

	/// overwrite fields with the ones set in the other record
	void update(file_infos const& other);

	bool operator==(file_infos const&) const = default;
};

/// returns copy of base where every non-empty and non-zero field of update replaces the base field
file_infos merge(file_infos const& base, file_infos const& update);

/// parses "[C]<permissions> <size> <filename>"
scp_error parse_permission_directive(std::string_view message, file_infos& out);

/// parses "[T]<atime> 0 <mtime> 0"
scp_error parse_time_directive(std::string_view message, file_infos& out);

inline scp_error parse_permission_directive(response const& r, file_infos& out) {
	return parse_permission_directive(r.message(), out);
}

inline scp_error parse_time_directive(response const& r, file_infos& out) {
	return parse_time_directive(r.message(), out);
}

/// checks that the name can be sent in a directive line
scp_error validate_filename(std::string_view);

/// checks that the permissions are octal digits only
scp_error validate_permissions(std::string_view);

/// "C<permissions> <size> <filename>\n"
std::string encode_permission_directive(file_infos const&);

/// "T<atime> 0 <mtime> 0\n"
std::string encode_time_directive(file_infos const&);

/// "D<permissions> 0 <filename>\n"
std::string encode_enter_directory(file_infos const&);

inline std::string_view const exit_directory_directive{"E\n"};

}

#endif
