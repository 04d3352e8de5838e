#pragma once

#include <iostream>
#include <mutex>
#include <string>

/**
 * Anything that can show a rendered status panel. Implemented by the console
 * display (periodic refresh) and by the HTTP response buffer (on request).
 */
class Updatable {
public:
    virtual ~Updatable() = default;

    virtual void display(const std::string& content) = 0;
};

// Prints each refresh to stdout, one "[Status]" prefixed line per panel line
class ConsoleStatusDisplay : public Updatable {
public:
    explicit ConsoleStatusDisplay(std::ostream& out = std::cout) : out_(out) {}

    void display(const std::string& content) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        std::string::size_type start = 0;
        while (start < content.size()) {
            std::string::size_type end = content.find('\n', start);
            if (end == std::string::npos) {
                end = content.size();
            }
            out_ << "[Status] " << content.substr(start, end - start) << "\n";
            start = end + 1;
        }
        out_.flush();
    }

private:
    std::ostream& out_;
    std::mutex out_mutex_;
};

// Keeps the last displayed content, used to build HTTP responses
class BufferedDisplay : public Updatable {
public:
    void display(const std::string& content) override { content_ = content; }

    const std::string& content() const { return content_; }

private:
    std::string content_;
};
