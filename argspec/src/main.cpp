//! # argspec Entry Point
//!
//! ```bash
//! argspec check tool.spec.json    # Compile and report errors
//! argspec dump tool.spec.json     # Print the compiled tree as JSON
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return argspec_main(argc, argv);
}
