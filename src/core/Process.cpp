#include "Process.h"
#include "Errors.h"
#include "OnceResult.h"
#include <cerrno>
#include <cstring>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arp_sweep {

namespace {

struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd(){ reset(); }
    void reset(){ if(fd>=0){ ::close(fd); fd=-1; } }
};

struct Pipe {
    Fd r, w;
    bool open(){ int p[2]; if(::pipe2(p, O_CLOEXEC)!=0) return false; r.fd=p[0]; w.fd=p[1]; return true; }
};

// Child bookkeeping shared by the collector and the watchdog. `exited` flips
// under the mutex before the zombie is reaped, so a signal sent while holding
// the mutex with exited==false can never reach a recycled pid.
struct ChildState {
    pid_t pid = -1;
    std::mutex m;
    std::condition_variable cv;
    bool exited = false;
};

int decode_status(int status){
    if(WIFEXITED(status)) return WEXITSTATUS(status);
    if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void throw_spawn(const std::string& prog, int err){
    throw SpawnError("Failed to execute " + prog + ": " + std::strerror(err), err);
}

bool child_has_exited(pid_t pid){
    siginfo_t info{}; info.si_pid = 0;
    if(::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) return errno == ECHILD;
    return info.si_pid == pid;
}

// Reads both pipes until EOF. Once the child itself has exited, remaining
// data is drained for a short window only: a grandchild that inherited the
// pipes must not keep the collector alive.
void collect_output(ChildState& st, int out_fd, int err_fd, ProcessResult& res){
    constexpr auto drain_window = std::chrono::milliseconds(200);
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    bool open_out = true, open_err = true;
    std::optional<std::chrono::steady_clock::time_point> exited_at;
    char buf[4096];
    while(open_out || open_err){
        fds[0].fd = open_out ? out_fd : -1;
        fds[1].fd = open_err ? err_fd : -1;
        int rc = ::poll(fds, 2, 100);
        if(rc < 0){ if(errno==EINTR) continue; break; }
        for(int i=0;i<2;++i){
            if(fds[i].fd < 0 || !(fds[i].revents & (POLLIN|POLLHUP|POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if(n < 0 && errno==EINTR) continue;
            if(n <= 0){ (i==0 ? open_out : open_err) = false; continue; }
            std::string chunk(buf, static_cast<size_t>(n));
            (i==0 ? res.out : res.err) += chunk;
            res.combined += chunk;
        }
        if(!exited_at){ if(child_has_exited(st.pid)) exited_at = std::chrono::steady_clock::now(); }
        else if(std::chrono::steady_clock::now() - *exited_at > drain_window) break;
    }
}

}

std::string join_argv(const std::vector<std::string>& argv){
    std::string s; for(size_t i=0;i<argv.size();++i){ if(i) s+=' '; s+=argv[i]; } return s;
}

ProcessRunner& default_process_runner(){
    static PosixProcessRunner runner;
    return runner;
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv, const ProcessOptions& opts){
    if(argv.empty()) throw_spawn("<empty>", EINVAL);
    const std::string& prog = argv.front();

    std::vector<char*> cargv;
    cargv.reserve(argv.size()+1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Pipe out, err, exec_status;
    if(!out.open() || !err.open() || !exec_status.open()) throw_spawn(prog, errno);

    const auto started = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if(pid < 0) throw_spawn(prog, errno);
    if(pid == 0){
        // Child: only async-signal-safe calls until exec.
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0){ ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
        ::dup2(out.w.fd, STDOUT_FILENO);
        ::dup2(err.w.fd, STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(exec_status.w.fd, &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    out.w.reset(); err.w.reset(); exec_status.w.reset();

    // exec_status closes on successful exec (O_CLOEXEC) or carries the exec errno.
    int exec_errno = 0;
    ssize_t n;
    do { n = ::read(exec_status.r.fd, &exec_errno, sizeof(exec_errno)); } while(n < 0 && errno == EINTR);
    if(n == static_cast<ssize_t>(sizeof(exec_errno))){
        int status = 0;
        while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw_spawn(prog, exec_errno);
    }

    ChildState st; st.pid = pid;
    OnceResult<ProcessResult> slot;

    std::thread collector([&]{
        ProcessResult res;
        collect_output(st, out.r.fd, err.r.fd, res);
        siginfo_t info{};
        while(::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}
        {
            std::lock_guard<std::mutex> lk(st.m);
            st.exited = true;
        }
        st.cv.notify_all();
        int status = 0;
        while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        res.exit_code = decode_status(status);
        slot.set_value(std::move(res));
    });

    std::thread watchdog;
    if(opts.deadline){
        watchdog = std::thread([&]{
            std::unique_lock<std::mutex> lk(st.m);
            if(st.cv.wait_until(lk, started + *opts.deadline, [&]{ return st.exited; })) return;
            if(!slot.claim()) return;
            ::kill(-pid, SIGTERM);
            if(!st.cv.wait_for(lk, opts.kill_grace, [&]{ return st.exited; })){
                ::kill(-pid, SIGKILL);
                st.cv.wait(lk, [&]{ return st.exited; });
            }
            lk.unlock();
            slot.set_exception(std::make_exception_ptr(TimeoutError(prog + " timed out")), true);
        });
    }

    collector.join();
    if(watchdog.joinable()) watchdog.join();
    return slot.get();
}

}
