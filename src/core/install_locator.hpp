#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

/// Finds the directory holding an existing install.
/// locate() throws UpdateError(ErrorKind::NotFound) when there is none.
class InstallLocator {
public:
    virtual ~InstallLocator() = default;

    virtual std::string locate() const = 0;

    /// Short label for log lines
    virtual std::string name() const = 0;
};

/// Runs a shell lookup script with bash (by default it sources the user's
/// profiles and runs `which discord`), canonicalizes the printed binary
/// path and returns its parent directory.
class ShellLookupLocator : public InstallLocator {
public:
    ShellLookupLocator(std::string home_dir, std::string script);

    std::string locate() const override;
    std::string name() const override { return "shell lookup"; }

    /// Parent directory of the canonical form of the first line of `output`
    static std::string install_dir_from_output(const std::string& output);

private:
    std::string home_dir_;
    std::string script_;
};

/// Always yields the same path
class FixedDefaultLocator : public InstallLocator {
public:
    explicit FixedDefaultLocator(std::string path);

    std::string locate() const override;
    std::string name() const override { return "default path"; }

private:
    std::string path_;
};

/// Tries each locator in order; the first success wins.
class LocatorChain : public InstallLocator {
public:
    using FailureHandler = std::function<void(const InstallLocator&, const std::string& reason)>;

    explicit LocatorChain(FailureHandler on_failure = nullptr);

    void add(std::unique_ptr<InstallLocator> locator);

    std::string locate() const override;
    std::string name() const override { return "locator chain"; }

private:
    std::vector<std::unique_ptr<InstallLocator>> locators_;
    FailureHandler on_failure_;
};
