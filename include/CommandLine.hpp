#pragma once

#include <string>
#include <vector>

enum class CommandLineAction
{
    Run,
    ShowHelp,
    ShowVersion,
    UsageError
};

struct CommandLineResult
{
    CommandLineAction Action = CommandLineAction::Run;
    std::string Error; // set for UsageError
};

// Applies the options to ConfigGlobal. Args excludes the program name.
CommandLineResult ParseCommandLine(const std::vector<std::string>& Args);

// Whole-string integer in 1..65535
bool ParsePositive(const std::string& Text, unsigned short int& Out);

std::string UsageText();
