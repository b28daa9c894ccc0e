/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#ifndef SPLITRANDR_PATHS_H
#define SPLITRANDR_PATHS_H

#include <stddef.h>
#include <string>

namespace splitrandr
{

// $XDG_CONFIG_HOME, falling back to $HOME/.config and the password database
std::string config_home();

// $SPLITRANDR_CONFIG or <config home>/splitrandr.bin
std::string binary_config_path();

// <config home>/cinnamon-monitors.xml
std::string monitors_xml_path();

// Creates the parent directories of path
bool make_parent_dirs(std::string const& path);

// Writes a sibling temporary file and renames it over path
bool write_file_atomically(std::string const& path, const void* data, size_t size);

// Removes path; a missing file counts as success
bool remove_file(std::string const& path);

} // namespace splitrandr

#endif // SPLITRANDR_PATHS_H
