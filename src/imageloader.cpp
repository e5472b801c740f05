#include "imageloader.h"
#include "slidesifterrors.h"
#include <QFile>
#include <vector>

cv::Mat ImageLoader::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw DecodeError(QString("Cannot open %1: %2")
                              .arg(filePath, file.errorString()).toStdString());
    }

    QByteArray fileData = file.readAll();
    file.close();

    if (fileData.isEmpty()) {
        throw DecodeError(QString("%1 is empty").arg(filePath).toStdString());
    }

    std::vector<uchar> buffer(fileData.begin(), fileData.end());

    cv::Mat image;
    try {
        image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(QString("Cannot decode %1: %2")
                              .arg(filePath, QString::fromStdString(e.what())).toStdString());
    }

    if (image.empty()) {
        throw DecodeError(QString("%1 is not a decodable image").arg(filePath).toStdString());
    }

    return image;
}
