// tests/FakeHost.hpp
#ifndef KILN_TESTS_FAKE_HOST_HPP
#define KILN_TESTS_FAKE_HOST_HPP

#include <Kiln/Errors.hpp>
#include <Kiln/FileSystem.hpp>
#include <Kiln/ProcessSpawner.hpp>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace KilnTests {

    class InMemoryFileSystem : public Kiln::FileSystem {
    public:
        void addFile(const std::filesystem::path& path, const std::string& contents = "") {
            m_files[path.lexically_normal().generic_string()] = contents;
        }
        void makeUnreadable(const std::filesystem::path& path) {
            m_unreadable.insert(path.lexically_normal().generic_string());
        }

        bool exists(const std::filesystem::path& path) const override {
            return m_files.count(path.lexically_normal().generic_string()) > 0;
        }

        std::string readText(const std::filesystem::path& path) const override {
            const auto key = path.lexically_normal().generic_string();
            if (m_unreadable.count(key) > 0) {
                throw std::runtime_error("permission denied");
            }
            auto it = m_files.find(key);
            if (it == m_files.end()) {
                throw std::runtime_error("no such file");
            }
            return it->second;
        }

    private:
        std::map<std::string, std::string> m_files;
        std::set<std::string> m_unreadable;
    };

    class RecordingSpawner : public Kiln::ProcessSpawner {
    public:
        Kiln::ProcessHandle spawnDetached(const Kiln::LaunchPlan& plan) override {
            spawned.push_back(plan);
            if (failWith) {
                throw Kiln::SpawnError(plan.executable, *failWith);
            }
            return Kiln::ProcessHandle{nextPid};
        }

        std::vector<Kiln::LaunchPlan> spawned;
        std::optional<std::string> failWith;
        std::int64_t nextPid = 4242;
    };

} // namespace KilnTests

#endif //KILN_TESTS_FAKE_HOST_HPP
