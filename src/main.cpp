#include "traceproxy/ProxyController.h"
#include "traceproxy/common/Config.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/network/EventLoop.h"

#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* prog) {
    printf("Usage: %s [-c config_file] [-C] [-h]\n", prog);
    printf("  -c  configuration file (default ../config/traceproxy.conf)\n");
    printf("  -C  check config, list the valid proxies and exit\n");
    printf("  SIGUSR1 toggles tracing, SIGUSR2 logs statistics, SIGINT/SIGTERM stop\n");
}

// Blocks the control signals and returns a signalfd delivering them, or -1.
int CreateSignalFd() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGUSR1);
    sigaddset(&mask, SIGUSR2);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        LOG_ERROR << "sigprocmask: " << std::strerror(errno);
        return -1;
    }
    int fd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR << "signalfd: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace traceproxy;

    std::string configFile = "../config/traceproxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                PrintUsage(argv[0]);
                return ch == 'h' ? 0 : 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile;
        return 1;
    }
    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    ProxyController controller(&loop);
    std::vector<std::string> errors;
    const size_t configured = controller.Configure(conf, &errors);

    if (checkOnly) {
        for (const std::string& e : errors) {
            printf("SKIPPED %s\n", e.c_str());
        }
        for (TcpProxyInstance* p : controller.instances()) {
            const ProxyConfig& pc = p->config();
            printf("%s: port %u -> ", pc.displayName.c_str(), static_cast<unsigned>(pc.sourcePort));
            for (size_t i = 0; i < pc.targets.size(); ++i) {
                printf("%s%s", i ? ", " : "", pc.targets[i].ToString().c_str());
            }
            printf(" (echo %s%s)\n", pc.echo.ToString().c_str(), pc.autoStart ? ", auto_start" : "");
        }
        printf(configured > 0 && errors.empty() ? "OK\n" : "INVALID\n");
        return configured > 0 && errors.empty() ? 0 : 1;
    }

    if (configured == 0) {
        LOG_ERROR << "No valid [proxy:<port>] section in " << configFile;
        return 1;
    }

    const int sigfd = CreateSignalFd();
    if (sigfd < 0) {
        return 1;
    }
    std::unique_ptr<network::Channel> sigChannel(new network::Channel(&loop, sigfd));
    sigChannel->SetReadCallback([&](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        while (::read(sigfd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            switch (info.ssi_signo) {
                case SIGUSR1:
                    controller.ToggleTrace();
                    break;
                case SIGUSR2:
                    LOG_INFO << "statistics\n" << controller.StatsReport();
                    break;
                case SIGINT:
                case SIGTERM:
                    LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
                    controller.Stop();
                    loop.Quit();
                    break;
                default:
                    break;
            }
        }
    });
    sigChannel->EnableReading();

    if (controller.StartConfigured() == 0) {
        LOG_ERROR << "No proxy could be started";
        sigChannel->DisableAll();
        sigChannel->Remove();
        ::close(sigfd);
        return 1;
    }

    loop.Loop();

    sigChannel->DisableAll();
    sigChannel->Remove();
    ::close(sigfd);
    return 0;
}
