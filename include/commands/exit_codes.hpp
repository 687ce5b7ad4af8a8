#pragma once

// process exit codes shared by every subcommand
enum ExitCode : int {
    kExitOk = 0,
    kExitInternalError = 1,     // unexpected std::exception
    kExitInputError = 2,        // InvalidInputError / bad arguments
    kExitProcessingError = 3    // DocumentReadError / DocumentEmptyError
};
