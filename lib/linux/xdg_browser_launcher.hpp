#ifndef XDG_BROWSER_LAUNCHER_HPP
#define XDG_BROWSER_LAUNCHER_HPP

#include <browser_launcher.hpp>
#include <log.hpp>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

extern char** environ;

namespace linux {

/**
 * @brief Opens URLs with the desktop's default handler
 *
 * Runs `xdg-open <url>` (macOS: `open -a "Google Chrome" <url>`) with its
 * output discarded. The child is reaped on a detached thread because some
 * handlers stay in the foreground for the browser's whole lifetime.
 */
class XdgBrowserLauncher : public features::BrowserLauncher {
public:
    bool openUrl(const std::string& url) override {
#ifdef __APPLE__
        std::vector<std::string> args = {"open", "-a", "Google Chrome", url};
#else
        std::vector<std::string> args = {"xdg-open", url};
#endif
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, 1, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, 2, "/dev/null", O_WRONLY, 0);

        pid_t pid = 0;
        int err = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        if (err != 0) {
            logWarn("Cannot run %s: %s", argv[0], strerror(err));
            return false;
        }

        std::thread([pid]() {
            int status = 0;
            waitpid(pid, &status, 0);
        }).detach();
        return true;
    }
};

} // namespace linux

#endif // XDG_BROWSER_LAUNCHER_HPP
