#ifndef SP_SCP_TRANSFER_REPORT_HEADER
#define SP_SCP_TRANSFER_REPORT_HEADER

#include "scp/core/file_infos.hpp"

namespace securepath::scp {

struct file_result {
	file_infos file;
	scp_error error;
};

/// per-file outcomes of one upload or download
struct transfer_report {
	std::vector<file_result> files;
	// payload bytes moved for files that completed
	std::uint64_t bytes{};

	void add(file_infos file, scp_error error) {
		if(!error) {
			bytes += file.size;
		}
		files.push_back(file_result{std::move(file), std::move(error)});
	}

	std::size_t failed_count() const {
		std::size_t count{};
		for(auto&& f : files) {
			if(f.error) {
				++count;
			}
		}
		return count;
	}
};

}

#endif
