#include "mod_deployer/Backtrace.hpp"
#include "platform/PlatformImpl.hpp"

namespace moddep {

	//---Захват стека: +1 кадр на сам capture()
	Backtrace Backtrace::capture(int skip)
	{
		Backtrace b;
		b.frames_ = platform::captureFrames(skip + 1);
		b.rendered_ = std::make_shared<Rendered>();
		return b;
	}

	const std::string& Backtrace::render() const
	{
		//---Пустой снимок (Backtrace()) слота не имеет
		if (!rendered_) rendered_ = std::make_shared<Rendered>();
		if (!rendered_->done)
		{
			rendered_->text = platform::symbolizeFrames(frames_);
			rendered_->done = true;
		}
		return rendered_->text;
	}

};//---namespace moddep
