#pragma once

namespace CLI {
class App;
}

namespace repofetch::cli {

// Exit codes shared by all subcommands
inline constexpr int kExitOk = 0;
inline constexpr int kExitFetchError = 1;
inline constexpr int kExitUsage = 2;

/**
 * `repofetch fetch <channel-subdir-url>`: refresh one cached index document.
 */
void registerFetchCommand(CLI::App& app);

/**
 * `repofetch state <artifact.json>`: print the validator record stored beside a
 * cached document.
 */
void registerStateCommand(CLI::App& app);

} // namespace repofetch::cli
