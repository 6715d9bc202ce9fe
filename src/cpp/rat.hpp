#pragma once

#include "rat/basic_types.hpp"
#include "rat/file.hpp"
#include "rat/classify.hpp"
#include "rat/transfer.hpp"
#include "rat/concat.hpp"
#include "rat/log.hpp"
#include "rat/environ.hpp"
#include "rat/cli.hpp"

/** @mainpage rat

    Concatenates files to standard output, picking copy_file_range or a
    read/write loop sized for the handles involved.

    - rat::transfer() copies one input, see transfer.hpp
    - rat::concatenate() / rat::CatBuilder run a whole list of inputs
    - rat::run_cli() is the command line program
*/
