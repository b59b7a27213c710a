#pragma once

#include "whisper/whisper_cli.hpp"

#include <cstdio>

// whisper-relay-cli <wav_file> [<model_name>]. Writes the transcript or
// "Error: ..." to `out`. The exit status is 0 whatever the outcome.
int run_cli(int argc, char* argv[], std::FILE* out, WhisperCli& whisper);
