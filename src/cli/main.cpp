#include "cli.hpp"

#include "platform/platform_env.hpp"

#include <cstdio>

int main(int argc, char* argv[]) {
    WhisperCli whisper(platform::task_root());
    return run_cli(argc, argv, stdout, whisper);
}
