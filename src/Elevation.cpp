#include "mod_deployer/Elevation.hpp"
#include "mod_deployer/Platform.hpp"
#include "mod_deployer/Process.hpp"
#include "platform/ChannelImpl.hpp"
#include "platform/PlatformImpl.hpp"

#include <cerrno>
#include <random>
#include <sstream>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace moddep {

	namespace {

		//---Коды pkexec: 126 - пользователь закрыл окно аутентификации, 127 - в доступе отказано
		constexpr int kLauncherDismissed = 126;
		constexpr int kLauncherNotAuthorized = 127;

		//------------------------------------------------------------
		//	Короткий случайный идентификатор для имени канала
		//------------------------------------------------------------
		static std::string shortId()
		{
			static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
			std::random_device rd;
			std::mt19937 gen(rd());
			std::uniform_int_distribution<int> dist(0, (int)sizeof(kAlphabet) - 2);

			std::string id;
			for (int i = 0; i < 10; ++i) id.push_back(kAlphabet[dist(gen)]);
			return id;
		}

		static ElevationResponse errorResponse(int code, std::string message)
		{
			ElevationResponse r;
			r.outcome = ElevationOutcome::Error;
			r.code = code;
			r.message = std::move(message);
			return r;
		}

		static const char* outcomeName(ElevationOutcome o)
		{
			switch (o)
			{
			case ElevationOutcome::Success:  return "success";
			case ElevationOutcome::Declined: return "declined";
			case ElevationOutcome::Error:    return "error";
			}
			return "error";
		}

		//---Помощник в отдельном процессе: канал + запуск через pkexec
		class ProcessElevatedHelper final : public IElevatedHelper {
		public:
			explicit ProcessElevatedHelper(ElevationOptions options)
				: options_(std::move(options))
			{
			}

			ElevationResponse run(const ElevationRequest& request) override
			{
				std::string err;

				//--- 1) Уникальный канал на время одного вызова
				platform::LocalChannel channel;
				const std::string name = "mod_deployer_elevated_" + shortId();
				if (!channel.listen(platform::runtimeDir(), name, &err))
				{
					return errorResponse(EIO, "failed to create elevation channel: " + err);
				}

				//--- 2) Запуск помощника (через средство повышения прав, если оно задано)
				const bool viaLauncher = !options_.launcher.empty();
				fs::path exe = options_.helperExe;
				std::vector<std::string> args;
				if (viaLauncher)
				{
					exe = options_.launcher;
					args.push_back(options_.helperExe.string());
				}
				args.push_back("--channel=" + channel.endpoint().string());

				process::SpawnResult sr;
				if (!process::spawn(exe, args, sr))
				{
					return errorResponse((int)sr.sysError, "failed to start elevated helper " + exe.string());
				}
				LOG(INFO) << "elevated helper started, pid=" << sr.pid << " function=" << request.function;

				//--- 3) Ожидание подключения или завершения помощника
				process::ExitStatus exit;
				const auto waited = channel.waitForPeer(sr.pid, exit, &err);
				if (waited == platform::LocalChannel::WaitResult::ChildExited)
				{
					//---Помощник не подключился: запрос прав был отклонён на уровне ОС?
					if (viaLauncher &&
						(exit.exitCode == kLauncherDismissed || exit.exitCode == kLauncherNotAuthorized))
					{
						LOG(WARNING) << "elevation declined by user (launcher exit code " << exit.exitCode << ")";
						ElevationResponse r;
						r.outcome = ElevationOutcome::Declined;
						r.code = exit.exitCode;
						r.message = "The operation was canceled by the user";
						return r;
					}
					return errorResponse(exit.exitCode,
						"elevated helper exited with code " + std::to_string(exit.exitCode) + " before connecting");
				}
				if (waited == platform::LocalChannel::WaitResult::Failed)
				{
					process::terminate(sr.pid);
					process::ExitStatus ignored;
					(void)process::wait(sr.pid, ignored);
					return errorResponse(EIO, err);
				}

				//--- 4) Обмен: запрос → ответ
				ElevationResponse response;
				std::string reply;
				if (!channel.sendAll(elevated::encodeRequest(request), &err) || !channel.receiveAll(reply, &err))
				{
					response = errorResponse(EIO, "elevation channel failed: " + err);
				}
				else if (reply.empty())
				{
					//---Помощник отключился без ответа - считаем, что функция выполнена
					response.outcome = ElevationOutcome::Success;
				}
				else if (!elevated::decodeResponse(reply, response, &err))
				{
					response = errorResponse(EIO, "malformed elevation response: " + err);
				}
				channel.close();

				process::ExitStatus done;
				if (!process::wait(sr.pid, done))
				{
					LOG(WARNING) << "waitpid for elevated helper failed, errno=" << done.sysError;
				}
				VLOG(1) << "elevated helper finished: " << outcomeName(response.outcome)
					<< " exit=" << done.exitCode;
				return response;
			}

		private:
			ElevationOptions options_;
		};

	} // namespace

	std::unique_ptr<IElevatedHelper> makeElevatedHelper(const ElevationOptions& options)
	{
		return std::make_unique<ProcessElevatedHelper>(options);
	}

	namespace elevated {

		ElevationRequest grantAccess(const fs::path& path, bool directory)
		{
			const UserIdentity user = currentUser();

			ElevationRequest r;
			r.function = directory ? kEnsureDirAccess : kGrantAccess;
			r.params["path"] = path.string();
			r.params["uid"] = std::to_string(user.uid);
			r.params["gid"] = std::to_string(user.gid);
			return r;
		}

		std::string encodeRequest(const ElevationRequest& request)
		{
			YAML::Emitter out;
			out << YAML::BeginMap;
			out << YAML::Key << "function" << YAML::Value << request.function;
			out << YAML::Key << "params" << YAML::Value << YAML::BeginMap;
			for (const auto& kv : request.params)
			{
				out << YAML::Key << kv.first << YAML::Value << kv.second;
			}
			out << YAML::EndMap;
			out << YAML::EndMap;
			return out.c_str();
		}

		bool decodeRequest(const std::string& text, ElevationRequest& out, std::string* error)
		{
			try
			{
				const YAML::Node root = YAML::Load(text);
				out.function = root["function"].as<std::string>();
				out.params.clear();
				if (const YAML::Node params = root["params"])
				{
					for (const auto& kv : params)
					{
						out.params[kv.first.as<std::string>()] = kv.second.as<std::string>();
					}
				}
				return true;
			}
			catch (const YAML::Exception& e)
			{
				if (error) *error = e.what();
				return false;
			}
		}

		std::string encodeResponse(const ElevationResponse& response)
		{
			YAML::Emitter out;
			out << YAML::BeginMap;
			out << YAML::Key << "outcome" << YAML::Value << outcomeName(response.outcome);
			out << YAML::Key << "code" << YAML::Value << response.code;
			out << YAML::Key << "message" << YAML::Value << response.message;
			out << YAML::EndMap;
			return out.c_str();
		}

		bool decodeResponse(const std::string& text, ElevationResponse& out, std::string* error)
		{
			try
			{
				const YAML::Node root = YAML::Load(text);
				const std::string outcome = root["outcome"].as<std::string>();
				if (outcome == "success") out.outcome = ElevationOutcome::Success;
				else if (outcome == "declined") out.outcome = ElevationOutcome::Declined;
				else if (outcome == "error") out.outcome = ElevationOutcome::Error;
				else
				{
					if (error) *error = "unknown outcome '" + outcome + "'";
					return false;
				}
				out.code = root["code"] ? root["code"].as<int>() : 0;
				out.message = root["message"] ? root["message"].as<std::string>() : std::string();
				return true;
			}
			catch (const YAML::Exception& e)
			{
				if (error) *error = e.what();
				return false;
			}
		}

		//------------------------------------------------------------
		//	Выполнение функции помощника (процесс уже с правами root)
		//------------------------------------------------------------
		ElevationResponse execute(const ElevationRequest& request)
		{
			const auto pathIt = request.params.find("path");
			const auto uidIt = request.params.find("uid");
			const auto gidIt = request.params.find("gid");
			if (pathIt == request.params.end() || uidIt == request.params.end() || gidIt == request.params.end())
			{
				return errorResponse(EINVAL, "missing parameters for " + request.function);
			}

			UserIdentity user;
			try
			{
				user.uid = (std::uint32_t)std::stoul(uidIt->second);
				user.gid = (std::uint32_t)std::stoul(gidIt->second);
			}
			catch (const std::exception&)
			{
				return errorResponse(EINVAL, "invalid uid/gid for " + request.function);
			}
			const fs::path path(pathIt->second);

			std::error_code ec;
			if (request.function == kEnsureDirAccess)
			{
				fs::create_directories(path, ec);
				if (ec) return errorResponse(ec.value(), "create_directories: " + ec.message());
			}
			else if (request.function != kGrantAccess)
			{
				return errorResponse(ENOSYS, "unknown function '" + request.function + "'");
			}

			if (!platform::grantAccess(path, user, ec))
			{
				return errorResponse(ec.value(), "grant access to " + path.string() + ": " + ec.message());
			}

			ElevationResponse r;
			r.outcome = ElevationOutcome::Success;
			return r;
		}

	} // namespace elevated

};//---namespace moddep
