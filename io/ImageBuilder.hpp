#pragma once

#include "decl.hxx"

namespace livecopy::io {

/// Writes a compressed image of an already mounted tree.
class ImageBuilder {
public:
	virtual ~ImageBuilder();
	virtual bool Build(const QString &source_mount_path,
		const QString &target_image_path, Error *err) = 0;
};

class SquashfsBuilder: public ImageBuilder {
public:
	SquashfsBuilder(ProcessRunner *runner);
	virtual ~SquashfsBuilder();
	
	bool Build(const QString &source_mount_path,
		const QString &target_image_path, Error *err) override;
	
private:
	ProcessRunner *runner_ = nullptr;
};

}
