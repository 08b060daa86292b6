/*
 * process_spawning_win32.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifdef _WIN32

#include "process_spawning.hpp"
#include "command_line.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <windows.h>
#include <tlhelp32.h>

namespace scriptdeck::exec {

namespace {

auto toWide(const std::string& text) -> std::wstring {
    if (text.empty()) {
        return {};
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, text.data(),
                                   static_cast<int>(text.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                        wide.data(), size);
    return wide;
}

auto lastErrorMessage(DWORD error) -> std::string {
    LPSTR buffer = nullptr;
    DWORD length = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
            FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, error, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = length ? std::string(buffer, length)
                                 : "error " + std::to_string(error);
    if (buffer) {
        LocalFree(buffer);
    }
    while (!message.empty() &&
           (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

// Inheritable pipe ends exist only while this is held, so a concurrent
// CreateProcessW(bInheritHandles = TRUE) cannot pick up another run's pipes
auto spawnMutex() -> std::mutex& {
    static std::mutex mutex;
    return mutex;
}

void closeHandle(void*& handle) {
    if (handle) {
        CloseHandle(static_cast<HANDLE>(handle));
        handle = nullptr;
    }
}

// Returns false on a read fault; EOF ends the loop normally
bool pumpPipe(void*& pipe, StreamKind kind, size_t bufferSize,
              const ChunkHandler& onChunk, DWORD& error) {
    std::vector<char> buffer(bufferSize > 0 ? bufferSize : 4096);
    while (true) {
        DWORD count = 0;
        if (!ReadFile(static_cast<HANDLE>(pipe), buffer.data(),
                      static_cast<DWORD>(buffer.size()), &count, nullptr)) {
            DWORD err = GetLastError();
            closeHandle(pipe);
            if (err == ERROR_BROKEN_PIPE) {
                return true;
            }
            error = err;
            return false;
        }
        if (count == 0) {
            closeHandle(pipe);
            return true;
        }
        onChunk(kind, std::string_view(buffer.data(), count));
    }
}

// Children first, so a parent cannot respawn them while we walk the tree
bool killTree(DWORD rootPid) {
    std::unordered_map<DWORD, std::vector<DWORD>> children;

    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot != INVALID_HANDLE_VALUE) {
        PROCESSENTRY32W entry;
        entry.dwSize = sizeof(entry);
        if (Process32FirstW(snapshot, &entry)) {
            do {
                if (entry.th32ProcessID != rootPid) {
                    children[entry.th32ParentProcessID].push_back(
                        entry.th32ProcessID);
                }
            } while (Process32NextW(snapshot, &entry));
        }
        CloseHandle(snapshot);
    } else {
        spdlog::warn("Process snapshot failed: {}",
                     lastErrorMessage(GetLastError()));
    }

    std::vector<DWORD> order;
    std::vector<DWORD> pending{rootPid};
    while (!pending.empty()) {
        DWORD pid = pending.back();
        pending.pop_back();
        order.push_back(pid);
        if (auto it = children.find(pid); it != children.end()) {
            pending.insert(pending.end(), it->second.begin(), it->second.end());
        }
    }

    bool rootKilled = false;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        HANDLE process = OpenProcess(PROCESS_TERMINATE, FALSE, *it);
        if (!process) {
            continue;
        }
        if (TerminateProcess(process, 1) && *it == rootPid) {
            rootKilled = true;
        }
        CloseHandle(process);
    }
    return rootKilled;
}

}  // namespace

Result<ChildProcess> ProcessSpawner::spawn(const ShellPlan& plan,
                                           const SpawnOptions& options) {
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.lpSecurityDescriptor = nullptr;
    sa.bInheritHandle = TRUE;

    std::unique_lock spawnLock(spawnMutex());

    HANDLE outRead = nullptr, outWrite = nullptr;
    HANDLE errRead = nullptr, errWrite = nullptr;
    if (!CreatePipe(&outRead, &outWrite, &sa, 0) ||
        !CreatePipe(&errRead, &errWrite, &sa, 0)) {
        DWORD err = GetLastError();
        for (HANDLE h : {outRead, outWrite, errRead, errWrite}) {
            if (h) CloseHandle(h);
        }
        return makeFailure(ExecutionError::SpawnFailure,
                           "CreatePipe: " + lastErrorMessage(err));
    }
    // Parent ends must not leak into the child
    SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    HANDLE nul = CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                             &sa, OPEN_EXISTING, 0, nullptr);

    STARTUPINFOW si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nul != INVALID_HANDLE_VALUE ? nul : nullptr;
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;
    ZeroMemory(&pi, sizeof(pi));

    std::wstring cmdLine =
        toWide(buildWindowsCommandLine(plan.executable, plan.argv));
    std::wstring workingDir = options.workingDirectory.wstring();

    BOOL created = CreateProcessW(
        nullptr, cmdLine.data(), nullptr, nullptr,
        TRUE,  // Inherit handles
        CREATE_NO_WINDOW, nullptr,
        workingDir.empty() ? nullptr : workingDir.c_str(), &si, &pi);
    DWORD createError = created ? 0 : GetLastError();

    CloseHandle(outWrite);
    CloseHandle(errWrite);
    if (nul != INVALID_HANDLE_VALUE) {
        CloseHandle(nul);
    }
    spawnLock.unlock();

    if (!created) {
        CloseHandle(outRead);
        CloseHandle(errRead);
        spdlog::error("CreateProcess failed for '{}': {}", plan.executable,
                      createError);
        return makeFailure(ExecutionError::SpawnFailure,
                           "spawn " + plan.executable + ": " +
                               lastErrorMessage(createError));
    }

    CloseHandle(pi.hThread);
    spdlog::debug("Spawned '{}' with PID {}", plan.executable, pi.dwProcessId);

    ChildProcess child;
    child.pid = static_cast<int>(pi.dwProcessId);
    child.processHandle = pi.hProcess;
    child.stdoutPipe = outRead;
    child.stderrPipe = errRead;
    return child;
}

Result<void> ProcessSpawner::drainOutput(ChildProcess& child,
                                         size_t bufferSize,
                                         const ChunkHandler& onChunk) {
    DWORD stderrError = 0;
    bool stderrOk = true;
    std::thread stderrReader([&] {
        stderrOk = pumpPipe(child.stderrPipe, StreamKind::Stderr, bufferSize,
                            onChunk, stderrError);
    });

    DWORD stdoutError = 0;
    bool stdoutOk = pumpPipe(child.stdoutPipe, StreamKind::Stdout, bufferSize,
                             onChunk, stdoutError);
    stderrReader.join();

    if (!stdoutOk) {
        return makeFailure(ExecutionError::RuntimeIOError,
                           "ReadFile: " + lastErrorMessage(stdoutError));
    }
    if (!stderrOk) {
        return makeFailure(ExecutionError::RuntimeIOError,
                           "ReadFile: " + lastErrorMessage(stderrError));
    }
    return {};
}

void ProcessSpawner::awaitExit(const ChildProcess& child) {
    if (child.processHandle) {
        WaitForSingleObject(static_cast<HANDLE>(child.processHandle), INFINITE);
    }
}

std::optional<int> ProcessSpawner::reap(ChildProcess& child) {
    closeHandle(child.stdoutPipe);
    closeHandle(child.stderrPipe);
    if (!child.processHandle) {
        return std::nullopt;
    }

    DWORD exitCode = 0;
    bool ok = GetExitCodeProcess(static_cast<HANDLE>(child.processHandle),
                                 &exitCode) != 0;
    closeHandle(child.processHandle);
    child.pid = -1;
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<int>(exitCode);
}

bool ProcessSpawner::terminate(int processId, bool /*wholeTree*/) {
    if (processId <= 0) {
        return false;
    }
    return killTree(static_cast<DWORD>(processId));
}

std::filesystem::path ProcessSpawner::homeDirectory() {
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) {
        return profile;
    }
    const char* drive = std::getenv("HOMEDRIVE");
    const char* path = std::getenv("HOMEPATH");
    if (drive && path) {
        return std::string(drive) + path;
    }
    return std::filesystem::current_path();
}

}  // namespace scriptdeck::exec

#endif  // _WIN32
