// Redirects a standard stream into a buffer for the lifetime of the object.
#pragma once

#include <ostream>
#include <sstream>
#include <string>

class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream)
        : target(stream), previous(stream.rdbuf(buffer.rdbuf())) {}
    ~StreamCapture() { target.rdbuf(previous); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string str() const { return buffer.str(); }

private:
    std::ostringstream buffer;
    std::ostream& target;
    std::streambuf* previous;
};
