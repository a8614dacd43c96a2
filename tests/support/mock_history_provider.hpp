#ifndef RKG_TESTS_SUPPORT_MOCK_HISTORY_PROVIDER_HPP
#define RKG_TESTS_SUPPORT_MOCK_HISTORY_PROVIDER_HPP

#include "rkg/analyzers/history_enricher.hpp"

#include <gmock/gmock.h>

namespace rkg::test_support {

    class MockHistoryProvider : public analyzers::IHistoryProvider {
    public:
        MOCK_METHOD(bool, is_repository, (const fs::path& root), (const, override));

        MOCK_METHOD((Result<std::vector<analyzers::CommitRecord>, Error>), file_log,
                    (const fs::path& root, const std::string& path, std::size_t max_commits),
                    (const, override));

        MOCK_METHOD((Result<analyzers::RepositoryStats, Error>), repository_stats,
                    (const fs::path& root), (const, override));

        MOCK_METHOD((Result<std::vector<std::string>, Error>), changed_files,
                    (const fs::path& root, const std::string& commit), (const, override));

        MOCK_METHOD((Result<std::size_t, Error>), commit_count,
                    (const fs::path& root, const std::string& path), (const, override));
    };

    inline analyzers::CommitRecord commit(
        const std::string& hash,
        const std::string& author,
        const std::string& date,
        const std::string& message = "change"
    ) {
        return {hash, author, author + "@example.com", date, message};
    }

}  // namespace rkg::test_support

#endif  // RKG_TESTS_SUPPORT_MOCK_HISTORY_PROVIDER_HPP
