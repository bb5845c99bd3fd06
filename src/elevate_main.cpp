#include <cerrno>
#include <string>

#include "mod_deployer/Cli.hpp"
#include "mod_deployer/Elevation.hpp"
#include "mod_deployer/Logging.hpp"
#include "platform/ChannelImpl.hpp"

#include <glog/logging.h>

//------------------------------------------------------------
//	Привилегированный помощник: один запрос из канала →
//	выполнение → ответ в канал
//------------------------------------------------------------
int main(int argc, char** argv) {

	moddep::initHelperLogging("mod-deployer-elevate");

	const moddep::HelperOptions opt = moddep::parseHelperCli(argc, argv);
	if (opt.channel.empty())
	{
		LOG(ERROR) << "Missing required option: --channel=<socket_path>";
		return 2;
	}

	//---Подключение к родительскому процессу
	std::string err;
	moddep::platform::LocalChannel channel;
	if (!moddep::platform::LocalChannel::connect(opt.channel, channel, &err))
	{
		LOG(ERROR) << "can't connect to " << opt.channel << ": " << err;
		return 1;
	}

	std::string text;
	if (!channel.receiveAll(text, &err))
	{
		LOG(ERROR) << "can't read request: " << err;
		return 1;
	}

	//---Выполнение запроса
	moddep::ElevationRequest request;
	moddep::ElevationResponse response;
	if (moddep::elevated::decodeRequest(text, request, &err))
	{
		LOG(INFO) << "executing " << request.function;
		response = moddep::elevated::execute(request);
	}
	else
	{
		response.outcome = moddep::ElevationOutcome::Error;
		response.code = EINVAL;
		response.message = "malformed request: " + err;
	}

	if (!channel.sendAll(moddep::elevated::encodeResponse(response), &err))
	{
		LOG(ERROR) << "can't send response: " << err;
		return 1;
	}
	return response.outcome == moddep::ElevationOutcome::Success ? 0 : 1;
}
