#include "limits.hpp"
#include <dirent.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <linux/capability.h>
#include <sys/mount.h>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fstream>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>
#include <vector>
#include "cgroup.hpp"
#include "utils.hpp"

using namespace std;

bool cgroup_create(const struct runguard_options &opt) {
    try {
        cgroup_guard::init();

        cgroup_guard cg(opt.cgroupname);

        // 初始化 memory 资源管控器
        cgroup_ctrl ctrl = cg.add_controller("memory");

        int64_t memory_limit = opt.memory_limit;
        if (memory_limit < 0) memory_limit = RLIM_INFINITY;

        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        ctrl.add_value("memory.limit_in_bytes", memory_limit);
        ctrl.add_value("memory.memsw.limit_in_bytes", memory_limit);

        if (!opt.cpuset.empty()) {
            cgroup_ctrl cpuset_ctrl = cg.add_controller("cpuset");
            cpuset_ctrl.add_value("cpuset.mems", "0");
            cpuset_ctrl.add_value("cpuset.cpus", opt.cpuset);
        }

        // 统计受控程序的 CPU 时间
        cg.add_controller("cpuacct");

        cg.create_cgroup(1);
        return true;
    } catch (cgroup_exception &e) {
        if (opt.strict) throw;
        LOG(WARNING) << "cgroup unavailable, falling back to /proc polling: " << e.what();
        return false;
    }
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();
    cg.attach_task();
}

void cgroup_kill(const struct runguard_options &opt) {
    void *handle = nullptr;
    pid_t pid;

    int ret = cgroup_get_task_begin(opt.cgroupname.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to kill process " << pid << " in cgroup: " << strerror(errno);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.add_controller("cpuacct");
    cg.add_controller("memory");

    if (!opt.cpuset.empty()) {
        cg.add_controller("cpuset");
    }

    cg.delete_cgroup();
}

static void write_proc_file(const string &path, const string &content) {
    ofstream fout(path);
    fout << content;
    if (!fout) throw system_error(errno, generic_category(), "writing " + path);
}

/**
 * @brief 进入新的 user namespace，并将当前用户映射为自身，保证之后 setuid(getuid()) 仍然合法
 */
static bool enter_user_namespace(int flags) {
    uid_t uid = getuid();
    gid_t gid = getgid();
    if (unshare(CLONE_NEWUSER | flags) != 0) return false;
    write_proc_file("/proc/self/setgroups", "deny");
    write_proc_file("/proc/self/uid_map", fmt::format("{} {} 1", uid, uid));
    write_proc_file("/proc/self/gid_map", fmt::format("{} {} 1", gid, gid));
    return true;
}

bool isolate_namespaces(const struct runguard_options &opt) {
    /*
     * CLONE_FILES：隔离文件描述符表，阻止受控程序访问评测引擎打开过的文件
     * CLONE_NEWIPC：隔离 IPC 命名空间，受控程序无法与主机程序进行进程间通信
     * CLONE_NEWNS：隔离挂载点
     * CLONE_NEWUTS：隔离 hostname 和 NIS
     * 这些命名空间需要 root 权限，非特权运行时失败是预期的
     */
    if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
        DLOG(INFO) << "unable to unshare namespaces: " << strerror(errno);

    if (opt.network == network_policy::ALLOW) return false;

    // 隔离网络命名空间，受控程序只能看到一个没有启用的 loopback 设备
    if (unshare(CLONE_NEWNET) == 0) return true;

    // 非特权模式下通过 user namespace 获得分离网络命名空间的能力
    return enter_user_namespace(CLONE_NEWNET);
}

/**
 * @brief 还原 mountinfo 中以八进制转义的空白和反斜杠，如 \040
 */
static string unescape_mount_point(const string &escaped) {
    string result;
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] == '\\' && i + 3 < escaped.size() &&
            isdigit(escaped[i + 1]) && isdigit(escaped[i + 2]) && isdigit(escaped[i + 3])) {
            result += (char)((escaped[i + 1] - '0') * 64 + (escaped[i + 2] - '0') * 8 + (escaped[i + 3] - '0'));
            i += 3;
        } else {
            result += escaped[i];
        }
    }
    return result;
}

static vector<string> mount_points() {
    ifstream fin("/proc/self/mountinfo");
    if (!fin) throw system_error(errno, generic_category(), "reading /proc/self/mountinfo");
    vector<string> points;
    string line;
    while (getline(fin, line)) {
        // 36 35 98:0 /mnt1 /mnt2 rw,noatime master:1 - ext3 /dev/root rw
        istringstream ss(line);
        string id, parent, device, root, point;
        if (ss >> id >> parent >> device >> root >> point)
            points.push_back(unescape_mount_point(point));
    }
    return points;
}

static bool is_within(const string &path, const string &dir) {
    if (dir == "/") return true;
    if (path.compare(0, dir.size(), dir) != 0) return false;
    return path.size() == dir.size() || path[dir.size()] == '/';
}

/**
 * @brief 只读重新挂载时必须保留原挂载点上的 nosuid 等标志，否则在 user namespace 中会被拒绝
 */
static bool locked_mount_flags(const string &point, unsigned long &flags) {
    static const vector<pair<unsigned long, unsigned long>> flag_table = {
        {ST_NOSUID, MS_NOSUID},
        {ST_NODEV, MS_NODEV},
        {ST_NOEXEC, MS_NOEXEC},
        {ST_NOATIME, MS_NOATIME},
        {ST_NODIRATIME, MS_NODIRATIME},
        {ST_RELATIME, MS_RELATIME}};

    struct statvfs st;
    if (statvfs(point.c_str(), &st) != 0) return false;
    flags = 0;
    for (auto &[st_flag, ms_flag] : flag_table)
        if (st.f_flag & st_flag) flags |= ms_flag;
    return true;
}

bool confine_filesystem(const struct runguard_options &opt) {
    vector<string> dirs = opt.writable_dirs;
    if (dirs.empty() && !opt.work_dir.empty()) dirs.push_back(opt.work_dir);

    try {
        if (unshare(CLONE_NEWNS) != 0) {
            if (errno != EPERM) throw system_error(errno, generic_category(), "unable to unshare mount namespace");
            if (!enter_user_namespace(CLONE_NEWNS))
                throw system_error(errno, generic_category(), "unable to unshare user and mount namespace");
        }

        // 挂载点的变化不能传播回主机
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
            throw system_error(errno, generic_category(), "unable to make mounts private");

        vector<string> writable;
        for (auto &dir : dirs) {
            string path = opt.chroot_dir.empty() ? dir : opt.chroot_dir + "/" + dir;
            char *resolved = realpath(path.c_str(), nullptr);
            if (!resolved) throw system_error(errno, generic_category(), "unable to resolve " + path);
            writable.emplace_back(resolved);
            free(resolved);

            // 绑定挂载后可写目录成为独立的挂载点，不受下面重新挂载其父挂载点的影响
            const char *target = writable.back().c_str();
            if (mount(target, target, nullptr, MS_BIND | MS_REC, nullptr) != 0)
                throw system_error(errno, generic_category(), fmt::format("unable to bind {}", writable.back()));
        }

        for (auto &point : mount_points()) {
            bool keep = false;
            for (auto &dir : writable) keep = keep || is_within(point, dir);
            if (keep) continue;

            unsigned long flags;
            // 被其他挂载点遮住的挂载点不可访问
            if (!locked_mount_flags(point, flags)) continue;
            if (mount(nullptr, point.c_str(), nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | flags, nullptr) != 0) {
                if (errno == ENOENT || errno == EACCES) continue;
                throw system_error(errno, generic_category(), fmt::format("unable to remount {} read-only", point));
            }
        }

        // 共享内存不能在不同的受控程序之间共享
        string shm_options = fmt::format("mode=1777,size={}", opt.memory_limit > 0 ? opt.memory_limit : 64 << 20);
        if (mount("tmpfs", "/dev/shm", "tmpfs", MS_NOSUID | MS_NODEV, shm_options.c_str()) != 0 && errno != ENOENT)
            throw system_error(errno, generic_category(), "unable to mount /dev/shm");
        return true;
    } catch (system_error &e) {
        if (opt.strict) throw;
        LOG(WARNING) << "filesystem writes are not confined: " << e.what();
        return false;
    }
}

/**
 * @brief 清空受控程序的所有 capability
 * user namespace 中以非 root 用户 setuid 不会清空 capability，受控程序仍然可以重新挂载文件系统
 */
static void drop_capabilities() {
    struct __user_cap_header_struct header;
    struct __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3];
    header.version = _LINUX_CAPABILITY_VERSION_3;
    header.pid = 0;
    memset(data, 0, sizeof(data));
    if (syscall(SYS_capset, &header, data) != 0)
        throw system_error(errno, generic_category(), "unable to drop capabilities");
}

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

bool set_restrictions(const struct runguard_options &opt, bool use_cgroup) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        string saved = path ? path : "";
        clearenv();
        if (!saved.empty()) setenv("PATH", saved.c_str(), true);
    }

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // memory limits(RLIMIT_AS, RLIMIT_DATA) are handled by cgroups or the watchdog
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc != numeric_limits<size_t>::max()) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    if (use_cgroup) cgroup_attach(opt);

    // run the command in a separate session and process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    // 受控程序被 runguard 杀死时不会收到 SIGHUP 之外的任何提示，这里确保 runguard
    // 意外退出时受控程序也会被杀死
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0)
        throw system_error(errno, generic_category(), "unable to set parent death signal");

    // 必须在 chroot 和切换用户之前完成，此后就没有挂载的权限了
    bool confined = confine_filesystem(opt);

    // set root directory and change working directory
    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");
    }

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1] = {(gid_t)opt.group_id};
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (opt.strict && (geteuid() == 0 || getuid() == 0))
        throw runtime_error("you cannot run user command as root");

    if (getuid() != 0) drop_capabilities();
    return confined;
}

// 受控程序调用这些系统调用时直接被 SIGSYS 杀死，runguard 将其记录为违规的系统调用
static const char *const escape_syscalls[] = {
    "mount", "umount2", "pivot_root", "chroot", "ptrace", "process_vm_readv",
    "process_vm_writev", "kexec_load", "kexec_file_load", "init_module",
    "finit_module", "delete_module", "reboot", "swapon", "swapoff", "setns",
    "unshare", "bpf", "perf_event_open", "keyctl", "add_key", "request_key",
    "open_by_handle_at", "name_to_handle_at", "userfaultfd"};

void set_seccomp(const struct runguard_options &opt) {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw runtime_error("seccomp_init failed");

    auto add_rule = [&](const char *name, unsigned arg_cnt, const scmp_arg_cmp *args) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR) return;  // 当前架构不存在该系统调用
        int ret = seccomp_rule_add_array(ctx, SCMP_ACT_KILL_PROCESS, nr, arg_cnt, args);
        if (ret < 0) {
            seccomp_release(ctx);
            throw system_error(-ret, generic_category(), fmt::format("seccomp_rule_add({})", name));
        }
    };

    for (const char *name : escape_syscalls)
        add_rule(name, 0, nullptr);

    if (opt.network == network_policy::DENY) {
        for (int family : {AF_INET, AF_INET6, AF_PACKET}) {
            scmp_arg_cmp cmp = SCMP_A0(SCMP_CMP_EQ, (scmp_datum_t)family);
            add_rule("socket", 1, &cmp);
        }
    }

    int ret = seccomp_load(ctx);
    seccomp_release(ctx);
    if (ret < 0)
        throw system_error(-ret, generic_category(), "seccomp_load");
}

/**
 * @brief 读取 /proc 中所有进程的父进程号
 */
static map<pid_t, pid_t> read_process_parents() {
    map<pid_t, pid_t> parents;
    DIR *dir = opendir("/proc");
    if (!dir) return parents;
    while (struct dirent *entry = readdir(dir)) {
        if (!is_number(entry->d_name)) continue;
        ifstream fin(fmt::format("/proc/{}/stat", entry->d_name));
        string content;
        if (!getline(fin, content)) continue;
        // 进程名可能包含空格和括号，因此从最后一个 ')' 之后开始解析
        auto pos = content.rfind(')');
        if (pos == string::npos || pos + 4 >= content.size()) continue;
        istringstream iss(content.substr(pos + 2));
        char state;
        pid_t ppid;
        if (iss >> state >> ppid)
            parents[atoi(entry->d_name)] = ppid;
    }
    closedir(dir);
    return parents;
}

static vector<pid_t> descendants_of(pid_t root) {
    auto parents = read_process_parents();
    vector<pid_t> result;
    for (auto &[pid, ppid] : parents) {
        pid_t cur = ppid;
        // 沿父进程链向上查找，深度有限，避免进程号复用产生环
        for (int depth = 0; cur > 1 && depth < 256; ++depth) {
            if (cur == root) {
                result.push_back(pid);
                break;
            }
            auto it = parents.find(cur);
            if (it == parents.end()) break;
            cur = it->second;
        }
    }
    return result;
}

int64_t descendants_rss() {
    static const long page_size = sysconf(_SC_PAGESIZE);
    int64_t total = 0;
    for (pid_t pid : descendants_of(getpid())) {
        ifstream fin(fmt::format("/proc/{}/statm", pid));
        int64_t size, resident;
        if (fin >> size >> resident) total += resident * page_size;
    }
    return total;
}

void reap_descendants() {
    while (true) {
        for (pid_t pid : descendants_of(getpid()))
            kill(pid, SIGKILL);

        int status;
        pid_t pid = waitpid(-1, &status, 0);
        if (pid < 0) {
            if (errno == EINTR) continue;
            if (errno == ECHILD) break;
            throw system_error(errno, generic_category(), "reaping descendants");
        }
    }
}
