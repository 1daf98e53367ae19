// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <bufstack/Views.hpp>
#include <core/Log.hpp>
#include <os/Accounts.hpp>
#include <os/FileSystem.hpp>
#include <screen/ScreenSession.hpp>
#include <tui/TerminalSurface.hpp>

#include <format>
#include <string>
#include <vector>

namespace bufstack
{

namespace
{
    constexpr auto HomeTitle = std::string_view { "home" };
} // namespace

struct App::Impl
{
    AppConfig config;
    tui::TerminalSurface surface;
    os::PosixAccounts accounts;
    os::LocalFileSystem fileSystem;
    std::unique_ptr<ScreenSession> session;
    std::vector<StatusHandle> statusLines;
    bool quit = false;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    void openFiles();
    void addStatusLine();
    void clearStatusLine();
    void flashMessage();
    void countDirectory();
    void runShellCommand();
    void askQuit();
    void killFocused();

    /// @brief Handles the application-wide keys.
    /// @return false if the key is not bound globally.
    auto handleGlobalKey(tui::KeyEvent const& key) -> bool;

    void reportError(std::string_view what, Error const& error);
};

void App::Impl::reportError(std::string_view what, Error const& error)
{
    log::error("{}: {}", what, error);
    session->flash(std::format("{}: {}", what, error.message));
}

void App::Impl::openFiles()
{
    auto paths = session->askForFilenames("filename", "Open: ", config.startDirectory);
    if (!paths)
    {
        reportError("Open", paths.error());
        return;
    }

    for (auto const& path: *paths)
    {
        auto loadError = std::optional<Error> {};
        auto buffer = session->stack().spawnUnlessExists(path, SpawnOptions {}, [&]() -> std::unique_ptr<View> {
            auto view = TextFileView::load(path);
            if (!view)
            {
                loadError = view.error();
                return nullptr;
            }
            return std::move(*view);
        });

        if (!buffer)
            reportError("Open", buffer.error());
        else if (!*buffer && loadError)
            reportError("Open", *loadError);
    }
}

void App::Impl::addStatusLine()
{
    auto text = session->ask("status", "Status line: ");
    if (!text)
    {
        reportError("Status", text.error());
        return;
    }
    if (*text && !(*text)->empty())
        statusLines.push_back(session->say(std::move(**text)));
}

void App::Impl::clearStatusLine()
{
    if (statusLines.empty())
    {
        session->flash("No status lines");
        return;
    }
    session->clear(statusLines.back());
    statusLines.pop_back();
}

void App::Impl::flashMessage()
{
    auto text = session->ask("flash", "Flash: ");
    if (!text)
    {
        reportError("Flash", text.error());
        return;
    }
    if (*text)
        session->flash(std::move(**text));
}

void App::Impl::countDirectory()
{
    auto const directory = fileSystem.currentDirectory();
    auto count = std::size_t { 0 };
    auto failure = std::optional<Error> {};

    session->say(std::format("Scanning {} ...", directory), [&](StatusHandle) {
        auto entries = fileSystem.listDirectory(directory);
        if (entries)
            count = entries->size();
        else
            failure = entries.error();
    });

    if (failure)
        reportError("Scan", *failure);
    else
        session->flash(std::format("{} entries in {}", count, directory));
}

void App::Impl::runShellCommand()
{
    auto command = session->ask("shell", "Shell command: ");
    if (!command)
    {
        reportError("Shell", command.error());
        return;
    }
    if (!*command || (*command)->empty())
        return;

    auto status = session->shellOut(**command);
    if (!status)
        reportError("Shell", status.error());
    else
        session->flash(std::format("'{}' exited with status {}", **command, *status));
}

void App::Impl::askQuit()
{
    auto answer = session->askYesOrNo("Quit bufstack? (y/n) ");
    if (!answer)
    {
        reportError("Quit", answer.error());
        return;
    }
    if (*answer && **answer)
        quit = true;
}

void App::Impl::killFocused()
{
    auto* focused = session->stack().focused();
    if (!focused)
        return;

    auto const title = focused->title();
    auto killed = session->stack().killBufferSafely(*focused);
    if (!killed)
        reportError("Kill", killed.error());
    else if (!*killed)
        session->flash(std::format("Buffer '{}' cannot be killed", title));
}

auto App::Impl::handleGlobalKey(tui::KeyEvent const& key) -> bool
{
    if (key == tui::ctrlKey('l'))
    {
        session->completelyRedrawScreen();
        return true;
    }

    if (tui::isChar(key, 'b'))
        session->stack().rollBuffers();
    else if (tui::isChar(key, 'B'))
        session->stack().rollBuffersBackwards();
    else if (tui::isChar(key, 'x'))
        killFocused();
    else if (tui::isChar(key, 'o'))
        openFiles();
    else if (tui::isChar(key, 's'))
        addStatusLine();
    else if (tui::isChar(key, 'c'))
        clearStatusLine();
    else if (tui::isChar(key, 'f'))
        flashMessage();
    else if (tui::isChar(key, 'l'))
        countDirectory();
    else if (tui::isChar(key, '!'))
        runShellCommand();
    else if (tui::isChar(key, 'q'))
        askQuit();
    else
        return false;
    return true;
}

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    if (_impl->session)
    {
        _impl->session->stack().killAllBuffers();
        _impl->session.reset();
    }
    _impl->surface.shutdown();
}

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    // The terminal belongs to the screen from here on; keep diagnostics in a file.
    auto const logPath = impl.config.log.file.empty() ? defaultLogPath() : impl.config.log.file;
    if (auto logged = log::setLogFile(logPath); !logged)
        return std::unexpected(logged.error());
    log::setLevel(impl.config.log.level);
    log::info("bufstack starting, logging to {}", logPath);

    if (auto initialized = impl.surface.initialize(); !initialized)
        return std::unexpected(initialized.error());

    impl.session = std::make_unique<ScreenSession>(
        impl.surface, impl.config.theme, impl.config.screen, impl.fileSystem, impl.accounts);

    auto home = impl.session->stack().spawn(HomeTitle, std::make_unique<HomeView>(impl.session->stack()));
    if (!home)
        return std::unexpected(home.error());

    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;
    auto& session = *impl.session;

    session.completelyRedrawScreen();
    session.flash(std::format("Welcome to bufstack. {} cancels, q quits.", tui::describeKey(impl.config.screen.cancelKey)));

    while (!impl.quit)
    {
        auto const event = impl.surface.poll(impl.config.screen.pollTimeoutMs);
        if (!event)
            continue;

        if (std::holds_alternative<tui::ResizeEvent>(*event))
        {
            session.stack().markDirty();
            session.drawScreen();
            continue;
        }

        auto const& key = std::get<tui::KeyEvent>(*event);
        session.eraseFlash();

        if (!impl.handleGlobalKey(key) && !session.handleInput(key))
            session.flash(std::format("Unknown command: {}", tui::describeKey(key)));

        session.drawScreen();
    }

    log::info("bufstack exiting");
    return 0;
}

} // namespace bufstack
