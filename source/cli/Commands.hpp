#pragma once

#include "Cli.hpp"

#include <d2anim/Error.hpp>

//! Load |opt.from| as JSON or tabbed text, check it and write the table.
d2anim::Result<void> compile(const CliOptions& opt);
//! Decode the table at |opt.from|, check it and write JSON or tabbed text.
d2anim::Result<void> decompile(const CliOptions& opt);
//! Decode and re-encode a table; with |opt.check| the bytes must match.
d2anim::Result<void> rebuild(const CliOptions& opt);

//! `RebuildMismatch` at the first offset where |rebuilt| leaves |original|.
d2anim::Result<void> CompareRebuild(std::span<const u8> original,
                                    std::span<const u8> rebuilt);

//! Dispatch on |opt.command|.
d2anim::Result<void> run(const CliOptions& opt);
