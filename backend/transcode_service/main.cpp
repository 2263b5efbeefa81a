#include "application/job_queue.hpp"
#include "application/rendition_catalog.hpp"
#include "application/streaming_service.hpp"
#include "application/transcode_engine.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/ffmpeg_encoder.hpp"
#include "infrastructure/grpc_authorizer.hpp"
#include "infrastructure/libav_media_inspector.hpp"
#include "infrastructure/local_content_store.hpp"
#include "infrastructure/mysql_store.hpp"
#include "infrastructure/sqlite_store.hpp"
#include "interface/rest_api_handler.hpp"
#include "interface/transcode_service_impl.hpp"

#include <boost/asio.hpp>
#include <grpcpp/server_builder.h>

#include <charconv>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace transcode_service;

namespace {

void usage() {
  std::cout << "Usage:\n"
            << "  transcode_service [--config PATH] serve\n"
            << "  transcode_service [--config PATH] enqueue --video-id N [--profile P] [--overwrite] [--wait]\n"
            << "  transcode_service [--config PATH] status <job_id>\n"
            << "  transcode_service [--config PATH] jobs --video-id N\n"
            << "  transcode_service [--config PATH] import --video-id N --source PATH [--title T] [--enqueue]\n"
            << "  transcode_service [--config PATH] remove --video-id N\n";
}

struct Args {
  std::string config_path{"config/streamforge.json"};
  std::string command;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;  // --name value
  bool overwrite{false};
  bool wait{false};
  bool enqueue{false};
};

std::optional<Args> parseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--overwrite") {
      args.overwrite = true;
    } else if (arg == "--wait") {
      args.wait = true;
    } else if (arg == "--enqueue") {
      args.enqueue = true;
    } else if (arg.starts_with("--")) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }
      if (arg == "--config") {
        args.config_path = argv[++i];
      } else {
        args.options[arg.substr(2)] = argv[++i];
      }
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  if (args.command.empty()) {
    return std::nullopt;
  }
  return args;
}

std::optional<int64_t> videoIdOption(const Args& args) {
  auto it = args.options.find("video-id");
  if (it == args.options.end()) {
    std::cerr << "--video-id is required\n";
    return std::nullopt;
  }
  int64_t id = 0;
  auto [ptr, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), id);
  if (ec != std::errc() || ptr != it->second.data() + it->second.size() || id <= 0) {
    std::cerr << "invalid video id: " << it->second << "\n";
    return std::nullopt;
  }
  return id;
}

// Everything the commands share, wired from one Config.
struct Services {
  std::shared_ptr<JobRepository> jobs;
  std::shared_ptr<RenditionRepository> renditions;
  std::shared_ptr<VideoRepository> videos;
  std::shared_ptr<LocalContentStore> hls_store;
  std::shared_ptr<RenditionCatalog> catalog;
  std::shared_ptr<TranscodeEngine> engine;
  std::shared_ptr<JobQueue> queue;
  std::shared_ptr<StreamingService> streaming;
};

Services buildServices(const config::Config& cfg) {
  Services s;
  const auto& db = cfg.getDatabase();
  if (db.backend == "mysql") {
    auto pool = std::make_shared<common::MySQLConnectionPool>(db, cfg.getDBCntPool());
    auto store = std::make_shared<MysqlStore>(pool);
    s.jobs = store;
    s.renditions = store;
    s.videos = store;
  } else if (db.backend == "sqlite") {
    auto store = std::make_shared<SqliteStore>(db.sqlite_path);
    s.jobs = store;
    s.renditions = store;
    s.videos = store;
  } else {
    throw std::runtime_error("unknown database.backend: " + db.backend);
  }

  const auto& transcode_cfg = cfg.getTranscode();
  auto profiles = ProfileSet::fromConfig(transcode_cfg.profiles);

  s.hls_store = std::make_shared<LocalContentStore>(cfg.getStorage().hls_root);
  s.catalog = std::make_shared<RenditionCatalog>(s.hls_store, s.renditions, profiles);
  s.engine = std::make_shared<TranscodeEngine>(
    s.hls_store,
    std::make_shared<LibavMediaInspector>(),
    std::make_shared<FfmpegEncoder>(transcode_cfg.ffmpeg_path),
    transcode_cfg);
  s.queue = std::make_shared<JobQueue>(s.jobs, s.videos, s.engine, s.catalog, profiles,
                                       transcode_cfg, cfg.getStorage());
  s.streaming = std::make_shared<StreamingService>(s.catalog, s.hls_store, profiles);
  return s;
}

void printJob(const Job& job) {
  std::cout << jobToJson(job).dump(2) << std::endl;
}

int serve(const config::Config& cfg, Services& s) {
  if (auto loaded = s.catalog->load(); !loaded) {
    std::cerr << "Failed to load renditions: " << loaded.error().describe() << std::endl;
    return 1;
  }
  if (auto started = s.queue->start(); !started) {
    std::cerr << "Failed to start job queue: " << started.error().describe() << std::endl;
    return 1;
  }

  std::shared_ptr<Authorizer> authorizer;
  if (cfg.getAuth().mode == "disabled") {
    std::cout << "Authorization disabled, every caller may stream every video" << std::endl;
    authorizer = std::make_shared<AllowAllAuthorizer>();
  } else {
    authorizer = std::make_shared<GrpcAuthorizer>(cfg.getAuth());
  }

  TranscodeServiceImpl grpc_service(s.queue, s.catalog, authorizer);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(cfg.getGrpcIpPort(), grpc::InsecureServerCredentials());
  builder.RegisterService(&grpc_service);
  std::unique_ptr<grpc::Server> grpc_server(builder.BuildAndStart());
  if (!grpc_server) {
    std::cerr << "Failed to start gRPC server on " << cfg.getGrpcIpPort() << std::endl;
    s.queue->stop();
    return 1;
  }
  std::cout << "gRPC Server listening on " << cfg.getGrpcIpPort() << std::endl;

  const auto& http_cfg = cfg.getHttp();
  const int threads = std::max(1, http_cfg.threads);
  boost::asio::io_context ioc{threads};
  auto api_handler = std::make_shared<RestApiHandler>(s.queue, s.catalog, s.streaming, authorizer);
  common::HttpServer http_server{ioc, http_cfg, api_handler};
  http_server.run();
  std::cout << "HTTP Server listening on " << http_cfg.host << ":" << http_cfg.port << std::endl;

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code&, int signo) {
    std::cout << "Signal " << signo << " received, shutting down" << std::endl;
    http_server.stop();
    ioc.stop();
  });

  std::vector<std::thread> http_threads;
  http_threads.reserve(threads - 1);
  for (int i = 1; i < threads; ++i) {
    http_threads.emplace_back([&ioc]() { ioc.run(); });
  }
  ioc.run();
  for (auto& t : http_threads) {
    t.join();
  }

  grpc_server->Shutdown();
  s.queue->stop();
  return 0;
}

// Returns 1 if any profile was refused.
int printOutcomes(const std::vector<ProfileEnqueueOutcome>& outcomes, std::vector<std::string>& accepted) {
  int rc = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.result) {
      std::cout << outcome.profile << ": job " << outcome.result->job_id
                << (outcome.result->coalesced ? " (already pending)" : " queued") << std::endl;
      accepted.push_back(outcome.result->job_id);
    } else {
      std::cerr << outcome.profile << ": " << outcome.result.error().describe() << std::endl;
      rc = 1;
    }
  }
  return rc;
}

int enqueue(const config::Config& cfg, Services& s, const Args& args) {
  auto video_id = videoIdOption(args);
  if (!video_id) {
    return 2;
  }

  // --wait runs the jobs enqueued here in this process; a running server
  // keeps the rest of the queue
  if (args.wait) {
    if (auto loaded = s.catalog->load(); !loaded) {
      std::cerr << "Failed to load renditions: " << loaded.error().describe() << std::endl;
      return 1;
    }
    if (auto started = s.queue->start(false); !started) {
      std::cerr << "Failed to start job queue: " << started.error().describe() << std::endl;
      return 1;
    }
  }

  std::vector<ProfileEnqueueOutcome> outcomes;
  if (auto it = args.options.find("profile"); it != args.options.end()) {
    outcomes.push_back(ProfileEnqueueOutcome{it->second, s.queue->enqueue(*video_id, it->second, args.overwrite)});
  } else {
    outcomes = s.queue->enqueueAll(*video_id, args.overwrite);
  }

  std::vector<std::string> accepted;
  int rc = printOutcomes(outcomes, accepted);

  if (args.wait) {
    const auto& tc = cfg.getTranscode();
    const auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
      (tc.job_timeout + std::chrono::duration_cast<std::chrono::seconds>(tc.backoff_max)) * tc.max_attempts);
    for (const auto& job_id : accepted) {
      auto job = s.queue->waitFor(job_id, budget);
      if (!job) {
        std::cerr << "job " << job_id << ": " << job.error().describe() << std::endl;
        rc = 1;
        continue;
      }
      printJob(*job);
      if (job->status != JobStatus::Succeeded) {
        rc = 1;
      }
    }
    s.queue->stop();
  }
  return rc;
}

int status(Services& s, const Args& args) {
  if (args.positional.empty()) {
    usage();
    return 2;
  }
  auto job = s.queue->status(args.positional.front());
  if (!job) {
    std::cerr << job.error().describe() << std::endl;
    return 1;
  }
  printJob(*job);
  return 0;
}

int listJobs(Services& s, const Args& args) {
  auto video_id = videoIdOption(args);
  if (!video_id) {
    return 2;
  }
  auto jobs = s.queue->jobsForVideo(*video_id);
  if (!jobs) {
    std::cerr << jobs.error().describe() << std::endl;
    return 1;
  }
  for (const auto& job : *jobs) {
    printJob(job);
  }
  return 0;
}

int importVideo(Services& s, const Args& args) {
  auto video_id = videoIdOption(args);
  auto source = args.options.find("source");
  if (!video_id || source == args.options.end()) {
    usage();
    return 2;
  }
  Video video{
    .id = *video_id,
    .source_path = source->second,
    .title = args.options.contains("title") ? args.options.at("title") : std::string()
  };
  auto saved = s.videos->save(video);
  if (!saved) {
    std::cerr << saved.error().describe() << std::endl;
    return 1;
  }
  std::cout << "video " << saved->id << " -> " << saved->source_path << std::endl;
  if (!args.enqueue) {
    return 0;
  }
  // queued only; a running server picks the jobs up on its next sweep
  std::vector<std::string> accepted;
  return printOutcomes(s.queue->enqueueAll(saved->id), accepted);
}

int removeVideo(Services& s, const Args& args) {
  auto video_id = videoIdOption(args);
  if (!video_id) {
    return 2;
  }
  auto cancelled = s.queue->removeVideo(*video_id);
  if (!cancelled) {
    std::cerr << cancelled.error().describe() << std::endl;
    return 1;
  }
  std::cout << "video " << *video_id << ": renditions removed, " << *cancelled << " queued jobs cancelled" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  auto args = parseArgs(argc, argv);
  if (!args) {
    usage();
    return 2;
  }

  try {
    const auto cfg = config::Config::fromFile(args->config_path);
    auto services = buildServices(cfg);

    if (args->command == "serve") {
      return serve(cfg, services);
    }
    if (args->command == "enqueue") {
      return enqueue(cfg, services, *args);
    }
    if (args->command == "status") {
      return status(services, *args);
    }
    if (args->command == "jobs") {
      return listJobs(services, *args);
    }
    if (args->command == "import") {
      return importVideo(services, *args);
    }
    if (args->command == "remove") {
      return removeVideo(services, *args);
    }
    usage();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
