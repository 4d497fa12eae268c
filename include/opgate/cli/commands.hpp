#pragma once

namespace opgate::cli {

int run_cli(int argc, char **argv);

} // namespace opgate::cli
