/**
 * Name: pysca::lex::InputSource
 * Purpose: Abstract line-oriented input source.
 */
#pragma once

#include <string>

namespace pysca::lex {

class InputSource {
public:
    virtual ~InputSource() = default;

    virtual bool getline(std::string& out) = 0; // returns false on EOF; strips the '\n'
    virtual const std::string& name() const = 0;
};

} // namespace pysca::lex
