//! # CLI Driver Interface
//!
//! `argspec_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main driver entry point
int argspec_main(int argc, char* argv[]);
